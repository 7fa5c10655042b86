#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace eagle_cpp
{

/// 문자열 전체를 소문자로 변환
inline std::string to_lower(std::string value)
{
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// 문자열 양 끝 공백 제거
inline std::string trim(const std::string & value)
{
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(start, end - start);
}

/// 쉼표 구분 목록 분리 (예: "a.wav, b.wav" → {"a.wav", "b.wav"}), 빈 항목은 제외
inline std::vector<std::string> split_list(const std::string & value, char delimiter = ',')
{
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(delimiter, start);
    if (end == std::string::npos) {
      end = value.size();
    }
    const std::string item = trim(value.substr(start, end - start));
    if (!item.empty()) {
      items.push_back(item);
    }
    start = end + 1;
  }
  return items;
}

inline bool ends_with(const std::string & value, const std::string & suffix)
{
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace eagle_cpp
