#pragma once

#include <iosfwd>

namespace pdfimg {

// pnginfo --in <input.png> [--data <out>] [--smask <out>] [--strict-chunks]
// Returns the process exit code: 0 success, 1 usage error, 2 any other error.
int run_pnginfo(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace pdfimg
