#ifndef ROSTER_TYPES_HPP
#define ROSTER_TYPES_HPP

#include <string>
#include <vector>

namespace roster {

/**
 * @brief A single positioned text unit extracted from one page
 *
 * Coordinates are in page points with the origin at the top-left corner.
 */
struct Token {
  std::string text;    ///< Glyph or word text (UTF-8)
  double x0 = 0.0;     ///< Left edge
  double top = 0.0;    ///< Top edge
  bool isBold = false; ///< Font weight (text layer only)
};

/**
 * @brief Granularity of the tokens produced by a token source
 */
enum class TokenGranularity {
  Character, ///< One token per glyph; lines concatenate without separator
  Word       ///< One token per word; lines join with a single space
};

/**
 * @brief A horizontally ordered run of tokens sharing one vertical position
 */
struct Line {
  std::string text;    ///< Reconstructed left-to-right text
  double y0 = 0.0;     ///< Smallest member top
  double y1 = 0.0;     ///< Largest member top
  bool isBold = false; ///< True if any member token is bold

  double midY() const { return (y0 + y1) / 2.0; }
};

/**
 * @brief A vertically contiguous block of lines
 */
struct Paragraph {
  std::vector<std::string> lines; ///< Line texts in reading order
  double y0 = 0.0;                ///< y0 of the first line
  double y1 = 0.0;                ///< y1 of the last line

  double midY() const { return (y0 + y1) / 2.0; }
};

/**
 * @brief A delegation header detected on a page
 */
struct Header {
  std::string name; ///< Text before the first slash, trimmed
  double midY;      ///< Vertical midpoint of the header paragraph
};

/**
 * @brief One attendee row
 */
struct Record {
  std::string delegation;
  std::string honorific;
  std::string personName;
  std::string affiliation;

  bool operator==(const Record &other) const {
    return delegation == other.delegation && honorific == other.honorific &&
           personName == other.personName && affiliation == other.affiliation;
  }
  bool operator!=(const Record &other) const { return !(*this == other); }
};

/**
 * @brief Number of reading columns on a page
 */
enum class LayoutMode {
  Single, ///< One reading column, bold delegation headers
  Two     ///< Two side-by-side columns, all-caps delegation headers
};

/**
 * @brief Layout requested by the caller
 */
enum class LayoutOverride {
  Auto, ///< Detect from the first pages
  One,  ///< Force single column
  Two   ///< Force two columns
};

/**
 * @brief Tokens of one page as returned by a token source
 */
struct PageTokens {
  int pageNumber = 0; ///< 1-indexed page number
  TokenGranularity granularity = TokenGranularity::Word;
  std::vector<Token> tokens; ///< Tokens in source order
  bool success = false;      ///< Whether extraction succeeded
  std::string errorMessage;  ///< Error message if failed
};

/**
 * @brief Human readable name of a layout mode ("one" / "two")
 */
inline const char *layoutModeName(LayoutMode mode) {
  return mode == LayoutMode::Two ? "two" : "one";
}

} // namespace roster

#endif // ROSTER_TYPES_HPP
