#include "Honorifics.hpp"
#include "LayoutEngine.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace roster {

namespace {

HonorificFragment title(const char *literal, TrailingSpace trailing) {
  return HonorificFragment{{HonorificPiece{literal, trailing}}};
}

// "H.E." / "S.E." followed by a personal title
HonorificFragment excellency(const char *prefix, const char *literal,
                             TrailingSpace trailing) {
  return HonorificFragment{{HonorificPiece{prefix, TrailingSpace::Optional},
                            HonorificPiece{literal, trailing}}};
}

std::vector<HonorificFragment> buildDefaultFragments() {
  const TrailingSpace none = TrailingSpace::None;
  const TrailingSpace opt = TrailingSpace::Optional;
  const TrailingSpace req = TrailingSpace::Required;

  std::vector<HonorificFragment> fragments = {
      title("Mr.", opt),    title("H.R.H.", opt), title("Mx.", opt),
      title("St.", none),   title("Miss", req),   title("Mlle", req),
      title("Mine", req),   title("H.H.", opt),   title("Ind.", opt),
      title("His", req),    title("Ind", req),    title("Ms", req),
      title("Mr", req),     title("Sra", req),    title("Sr", req),
      title("M", req),      title("On", req),     title("Fr", req),
      title("H.O.", opt),   title("Rev", req),    title("Mme", req),
      title("Msgr", req),   title("On.", opt),    title("Fr.", opt),
      title("Rev.", opt),
  };

  // His/Her Excellency forms must win over the bare "H.E"
  const std::pair<const char *, TrailingSpace> heTitles[] = {
      {"Ms.", opt}, {"Mr.", opt},  {"Ms", req},   {"Mr", req},
      {"Sra", req}, {"Sr", req},   {"Sra.", opt}, {"Mme", none},
      {"Sr.", opt}, {"Msgr.", opt}};
  for (const auto &entry : heTitles) {
    fragments.push_back(excellency("H.E.", entry.first, entry.second));
  }
  fragments.push_back(title("H.E", none));

  const HonorificFragment plain[] = {
      title("Msgr.", opt), title("Mrs.", opt), title("Sra.", opt),
      title("Sr.", opt),   title("Ms.", opt),  title("Dr.", opt),
      title("Prof.", opt), title("M.", opt),   title("Mme", none),
      title("Ms", none)};
  fragments.insert(fragments.end(), std::begin(plain), std::end(plain));

  // Son Excellence forms, same rule as above
  const std::pair<const char *, TrailingSpace> seTitles[] = {
      {"Ms.", opt}, {"Mr.", opt},   {"Mme", none}, {"Mr", none},
      {"Ms", none}, {"Dr", none},   {"Msgr.", opt}, {"M.", opt},
      {"Ms", req},  {"Mr", req},    {"Sra", req},  {"Sr", req},
      {"M", req},   {"Sra.", opt},  {"Sr.", opt}};
  for (const auto &entry : seTitles) {
    fragments.push_back(excellency("S.E.", entry.first, entry.second));
  }
  fragments.push_back(title("S.E", none));

  return fragments;
}

// Returns the end offset of the match, or 0 when the fragment does not match
size_t matchFragment(const HonorificFragment &fragment,
                     const std::string &text) {
  size_t pos = 0;

  for (const auto &piece : fragment.pieces) {
    if (piece.literal.empty() ||
        text.compare(pos, piece.literal.size(), piece.literal) != 0) {
      return 0;
    }
    pos += piece.literal.size();

    switch (piece.trailing) {
    case TrailingSpace::None:
      break;
    case TrailingSpace::Optional:
      while (pos < text.size() &&
             std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
      }
      break;
    case TrailingSpace::Required:
      if (pos >= text.size() || text[pos] != ' ') {
        return 0;
      }
      ++pos;
      break;
    }
  }

  return pos;
}

} // anonymous namespace

HonorificParser::HonorificParser() : m_fragments(defaultFragments()) {}

HonorificParser::HonorificParser(std::vector<HonorificFragment> fragments)
    : m_fragments(std::move(fragments)) {}

const std::vector<HonorificFragment> &HonorificParser::defaultFragments() {
  static const std::vector<HonorificFragment> fragments =
      buildDefaultFragments();
  return fragments;
}

size_t HonorificParser::matchLength(const std::string &text) const {
  for (const auto &fragment : m_fragments) {
    size_t length = matchFragment(fragment, text);
    if (length > 0) {
      return length;
    }
  }
  return 0;
}

HonorificMatch HonorificParser::parse(const std::string &line) const {
  HonorificMatch match;
  std::string text = trim(line);

  size_t length = matchLength(text);
  if (length == 0) {
    match.person = text;
    return match;
  }

  match.honorific = trim(text.substr(0, length));
  match.person = trim(text.substr(length));
  return match;
}

} // namespace roster
