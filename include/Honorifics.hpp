#ifndef ROSTER_HONORIFICS_HPP
#define ROSTER_HONORIFICS_HPP

#include <string>
#include <vector>

namespace roster {

/**
 * @brief Whitespace allowed after a literal piece of an honorific
 */
enum class TrailingSpace {
  None,     ///< Nothing is consumed after the literal
  Optional, ///< Any run of whitespace (possibly empty) is consumed
  Required  ///< Exactly one space must follow and is consumed
};

/**
 * @brief One literal of an honorific fragment and the whitespace after it
 */
struct HonorificPiece {
  std::string literal;
  TrailingSpace trailing = TrailingSpace::None;
};

/**
 * @brief A title fragment made of one or more consecutive pieces
 *
 * Compound titles such as "H.E. Mr." are two pieces: ("H.E.", Optional)
 * followed by ("Mr.", Optional).
 */
struct HonorificFragment {
  std::vector<HonorificPiece> pieces;
};

/**
 * @brief Result of splitting a name line
 */
struct HonorificMatch {
  std::string honorific; ///< Matched title, trimmed; empty if none matched
  std::string person;    ///< Remainder of the line, trimmed
};

/**
 * @brief Splits a leading title off a name line
 *
 * Fragments are tried in list order and the first one matching at the start
 * of the line wins, so compound forms must be listed before the shorter
 * titles they begin with.
 *
 * Example usage:
 * @code
 * roster::HonorificParser parser;
 * auto match = parser.parse("Mr. John Smith");
 * // match.honorific == "Mr.", match.person == "John Smith"
 * @endcode
 */
class HonorificParser {
public:
  /**
   * @brief Construct with the built-in roster lexicon
   */
  HonorificParser();

  /**
   * @brief Construct with a custom ordered fragment list
   */
  explicit HonorificParser(std::vector<HonorificFragment> fragments);

  /**
   * @brief Split a line into (honorific, person)
   * @param line Name line; surrounding whitespace is ignored
   */
  HonorificMatch parse(const std::string &line) const;

  /**
   * @brief Length in bytes of the first fragment matching at the start of text
   * @return Matched length including consumed whitespace, or 0 if none match
   */
  size_t matchLength(const std::string &text) const;

  const std::vector<HonorificFragment> &fragments() const {
    return m_fragments;
  }

  /**
   * @brief The built-in ordered lexicon of titles used on delegate rosters
   */
  static const std::vector<HonorificFragment> &defaultFragments();

private:
  std::vector<HonorificFragment> m_fragments; ///< Ordered fragment list
};

} // namespace roster

#endif // ROSTER_HONORIFICS_HPP
