#include "util/Html.hpp"

namespace vigil::util {

void append_html_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#x27;"; break;
      default:   out += c;
    }
  }
}

} // namespace vigil::util
