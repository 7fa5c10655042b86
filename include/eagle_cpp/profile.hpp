#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace eagle_cpp
{

/// Serialized voice model of one enrolled speaker. The byte layout belongs to
/// the engine; this type only owns and transports it.
class Profile
{
public:
  /// Throws EagleError(INVALID_ARGUMENT) for an empty buffer.
  static Profile from_bytes(const std::vector<uint8_t> & bytes);
  static Profile from_bytes(const uint8_t * data, size_t size);

  std::vector<uint8_t> to_bytes() const;

  const uint8_t * data() const;
  size_t size() const;

  bool operator==(const Profile & other) const;
  bool operator!=(const Profile & other) const;

private:
  explicit Profile(std::vector<uint8_t> bytes);

  std::vector<uint8_t> bytes_;
};

/// 프로파일 원시 바이트를 파일에서 읽음. 실패 시 EagleError(IO)
Profile load_profile(const std::string & path);

/// 프로파일 원시 바이트를 파일로 저장. 실패 시 EagleError(IO)
void save_profile(const Profile & profile, const std::string & path);

}  // namespace eagle_cpp
