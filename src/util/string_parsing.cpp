#include "util/string_parsing.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace meshwalk {
namespace util {

namespace {

bool StartsWithSpace(const std::string& str) {
  return str.empty() || std::isspace(static_cast<unsigned char>(str[0]));
}

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // anonymous namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  // Reject empty or whitespace-leading strings
  if (StartsWithSpace(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<double> SafeParseDouble(const std::string& str, double min, double max) {
  if (StartsWithSpace(str)) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    double value = std::stod(str, &pos);

    if (pos != str.size() || !std::isfinite(value)) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string HexStr(const std::vector<uint8_t>& data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t byte : data) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string& str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexDigitValue(str[i]);
    int lo = HexDigitValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string TrimWhitespace(std::string_view str) {
  size_t begin = 0;
  while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin]))) {
    ++begin;
  }
  size_t end = str.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

std::vector<std::string> SplitWhitespace(std::string_view str) {
  std::vector<std::string> tokens;
  size_t i = 0;
  while (i < str.size()) {
    while (i < str.size() && std::isspace(static_cast<unsigned char>(str[i]))) {
      ++i;
    }
    size_t start = i;
    while (i < str.size() && !std::isspace(static_cast<unsigned char>(str[i]))) {
      ++i;
    }
    if (i > start) {
      tokens.emplace_back(str.substr(start, i - start));
    }
  }
  return tokens;
}

bool IsValidUtf8(std::string_view str) {
  size_t i = 0;
  while (i < str.size()) {
    const auto c = static_cast<unsigned char>(str[i]);
    size_t extra;
    uint32_t cp;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= str.size()) {
      return false; // truncated sequence
    }
    for (size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<unsigned char>(str[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }

    // Reject overlong encodings, surrogates and out-of-range code points
    static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[extra] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

} // namespace util
} // namespace meshwalk
