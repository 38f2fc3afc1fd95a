#include "sendpath/transfer-stats.hpp"

#include <iterator>
#include <string>
#include <string_view>

#include "sendpath/log.hpp"

namespace sendpath {

std::string TransferStats::json_str() const {
  std::string out;
  out.reserve(192UL);
  out.push_back('{');
  for_each_field([&out](std::string_view name, auto value) {
    if (out.size() > 1) {
      out.push_back(',');
    }
    fmt::format_to(std::back_inserter(out), "\"{}\":{}", name, value);
  });
  out.push_back('}');
  return out;
}

}  // namespace sendpath
