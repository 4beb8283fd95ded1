#pragma once
#include <string>
#include <chrono>
#include <optional>

namespace sku_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// Quoted and escaped string, or the literal null when absent.
std::string quote_or_null(const std::optional<std::string>& v);
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
