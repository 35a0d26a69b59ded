#pragma once
#include <string>
#include <string_view>

namespace vigil::util {

// Escapes & < > " ' for use in element text and attribute values.
void append_html_escaped(std::string& out, std::string_view sv);

} // namespace vigil::util
