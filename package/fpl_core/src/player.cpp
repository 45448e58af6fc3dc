#include "fpl_core/player.hpp"

#include <cctype>

namespace fpl_core {

namespace {

std::string normalize_token(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)))
      continue;
    out.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
  }
  return out;
}

} // namespace

std::string position_code(Position p) {
  switch (p) {
  case Position::Goalkeeper:
    return "GKP";
  case Position::Defender:
    return "DEF";
  case Position::Midfielder:
    return "MID";
  case Position::Forward:
    return "FWD";
  }
  return "UNK";
}

std::string availability_name(Availability a) {
  switch (a) {
  case Availability::Available:
    return "available";
  case Availability::Doubtful:
    return "doubtful";
  case Availability::Unavailable:
    return "unavailable";
  }
  return "unknown";
}

std::optional<Position> parse_position(const std::string &text) {
  const std::string t = normalize_token(text);
  if (t == "GKP" || t == "GK" || t == "G" || t == "GOALKEEPER")
    return Position::Goalkeeper;
  if (t == "DEF" || t == "D" || t == "DEFENDER")
    return Position::Defender;
  if (t == "MID" || t == "M" || t == "MIDFIELDER")
    return Position::Midfielder;
  if (t == "FWD" || t == "FW" || t == "F" || t == "FORWARD")
    return Position::Forward;
  return std::nullopt;
}

std::optional<Availability> parse_availability(const std::string &text) {
  const std::string t = normalize_token(text);
  if (t.empty() || t == "A" || t == "AVAILABLE")
    return Availability::Available;
  if (t == "D" || t == "DOUBTFUL")
    return Availability::Doubtful;
  // i=injured, s=suspended, u=unavailable (left club), n=not eligible
  if (t == "I" || t == "S" || t == "U" || t == "N" || t == "INJURED" ||
      t == "SUSPENDED" || t == "UNAVAILABLE")
    return Availability::Unavailable;
  return std::nullopt;
}

} // namespace fpl_core
