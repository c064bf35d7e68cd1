#ifndef ROSTER_TOKEN_SOURCE_HPP
#define ROSTER_TOKEN_SOURCE_HPP

#include "RosterTypes.hpp"

namespace roster {

/**
 * @brief Supplies positioned tokens for the pages of one document
 *
 * Implementations report per-page failures through PageTokens::success and
 * PageTokens::errorMessage. Callers also guard against exceptions escaping
 * extractPage().
 */
class TokenSource {
public:
  virtual ~TokenSource() = default;

  /**
   * @brief Number of pages in the document
   */
  virtual int pageCount() const = 0;

  /**
   * @brief Extract the tokens of one page
   * @param pageIndex 0-indexed page number
   * @param granularity Requested granularity; sources that only produce
   * words ignore a request for glyphs
   * @return Page tokens with coordinates in page points, origin top-left
   */
  virtual PageTokens extractPage(int pageIndex,
                                 TokenGranularity granularity) = 0;

  /**
   * @brief Whether tokens carry a meaningful bold flag
   */
  virtual bool hasFontWeight() const = 0;
};

} // namespace roster

#endif // ROSTER_TOKEN_SOURCE_HPP
