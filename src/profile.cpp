#include "eagle_cpp/profile.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include "eagle_cpp/errors.hpp"

using namespace std;


namespace eagle_cpp
{

Profile::Profile(vector<uint8_t> bytes)
: bytes_(move(bytes))
{
}

Profile Profile::from_bytes(const vector<uint8_t> & bytes)
{
  return from_bytes(bytes.data(), bytes.size());
}

Profile Profile::from_bytes(const uint8_t * data, size_t size)
{
  if (!data || size == 0) {
    throw EagleError(ErrorKind::INVALID_ARGUMENT, "Speaker profile must not be empty");
  }
  return Profile(vector<uint8_t>(data, data + size));
}

vector<uint8_t> Profile::to_bytes() const
{
  return bytes_;
}

const uint8_t * Profile::data() const
{
  return bytes_.data();
}

size_t Profile::size() const
{
  return bytes_.size();
}

bool Profile::operator==(const Profile & other) const
{
  return bytes_ == other.bytes_;
}

bool Profile::operator!=(const Profile & other) const
{
  return !(*this == other);
}

Profile load_profile(const string & path)
{
  ifstream in(path, ios::binary);
  if (!in.is_open()) {
    throw EagleError(ErrorKind::IO, "Failed to open speaker profile file at `" + path + "`");
  }

  vector<uint8_t> bytes(
    (istreambuf_iterator<char>(in)),
    istreambuf_iterator<char>());
  if (in.bad()) {
    throw EagleError(ErrorKind::IO, "Failed to read speaker profile from `" + path + "`");
  }
  if (bytes.empty()) {
    throw EagleError(ErrorKind::IO, "Speaker profile file at `" + path + "` is empty");
  }
  return Profile::from_bytes(bytes);
}

void save_profile(const Profile & profile, const string & path)
{
  ofstream out(path, ios::binary | ios::trunc);
  if (!out.is_open()) {
    throw EagleError(ErrorKind::IO, "Failed to open `" + path + "` for writing");
  }

  out.write(
    reinterpret_cast<const char *>(profile.data()),
    static_cast<streamsize>(profile.size()));
  out.flush();
  if (!out.good()) {
    throw EagleError(ErrorKind::IO, "Failed to write speaker profile to `" + path + "`");
  }
}

}  // namespace eagle_cpp
