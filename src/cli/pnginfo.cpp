#include "cli/pnginfo.hpp"

#include "cli/cli_parser.hpp"
#include "codec/errors.hpp"
#include "codec/png_decoder.hpp"
#include "codec/xobject_fields.hpp"
#include "io/png_file.hpp"

#include <ostream>

namespace pdfimg {

namespace {

const char* kUsage =
    "Usage: pnginfo --in <input.png> [--data <color.zlib>] [--smask <alpha.zlib>] [--strict-chunks]\n";

static void print_descriptor(const ImageDescriptor& d, std::ostream& out) {
    out << "Width: " << d.width << "\n";
    out << "Height: " << d.height << "\n";
    out << "ColorSpace: /" << pdf_color_space_name(d.color_space);
    if (d.color_space == ColorSpace::Indexed) {
        out << " (" << d.palette_entries() << " entries)";
    }
    out << "\n";
    out << "BitsPerComponent: " << d.bits_per_component << "\n";
    out << "Filter: /" << d.filter_name << "\n";
    out << "DecodeParms: << " << decode_parms_string(d.decode_parameters) << " >>\n";
    if (d.transparency) {
        out << "Mask: " << mask_array(*d.transparency) << "\n";
    }
    out << "Data: " << d.compressed_data.size() << " bytes\n";
    if (d.soft_mask) {
        out << "SMask: " << d.soft_mask->size() << " bytes\n";
    }
    out << "MinimumPdfVersion: " << d.minimum_pdf_version.to_string() << "\n";
}

} // namespace

int run_pnginfo(int argc, char** argv, std::ostream& out, std::ostream& err) {
    CliParser cli{"strict-chunks"};
    try {
        cli.parse(argc, argv);
    } catch (const std::runtime_error& e) {
        err << "[ERROR] " << e.what() << "\n" << kUsage;
        return 1;
    }
    const std::string in = cli.get("in");
    if (in.empty() || in == "true") {
        err << kUsage;
        return 1;
    }

    try {
        DecodeOptions options;
        options.stop_at_empty_chunk = !cli.flag("strict-chunks");

        const auto desc = decode_png_file(in, options);
        print_descriptor(desc, out);

        const std::string data_out = cli.get("data");
        if (!data_out.empty()) {
            write_all(data_out, desc.compressed_data);
            out << "Wrote: " << data_out << "\n";
        }
        const std::string smask_out = cli.get("smask");
        if (!smask_out.empty()) {
            if (!desc.soft_mask) {
                err << "[WARN] " << in << " has no alpha channel, --smask ignored\n";
            } else {
                write_all(smask_out, *desc.soft_mask);
                out << "Wrote: " << smask_out << "\n";
            }
        }
        return 0;
    } catch (const DecodeError& e) {
        err << "[ERROR] " << error_code_name(e.code()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        err << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}

} // namespace pdfimg
