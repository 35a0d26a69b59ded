#pragma once
#include <stdexcept>
#include <string>

namespace vigil::util {

// Missing or invalid threshold configuration. Aborts the run.
struct ConfigurationError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Missing input file or a document that cannot be read at all.
// Row-level problems are never reported this way; they become defects.
struct InputError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Output directory or archive cannot be written.
struct IOError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace vigil::util
