#ifndef ROSTER_LAYOUT_ENGINE_HPP
#define ROSTER_LAYOUT_ENGINE_HPP

#include "RosterTypes.hpp"

#include <string>
#include <vector>

namespace roster {

/**
 * @brief Geometry parameters shared by the layout stages
 */
struct LayoutConfig {
  double xThreshold = 260.0;   ///< Column split on token x0, in page points
  double yTolerance = 3.0;     ///< Max top difference for tokens on one line
  double paragraphFactor = 1.5; ///< Multiplier on the median line gap
  double columnShare = 0.25;   ///< Min share of tokens per side for two columns
};

/**
 * @brief Left and right token streams of one page
 */
struct ColumnStreams {
  std::vector<Token> left;  ///< Tokens with x0 < threshold
  std::vector<Token> right; ///< Tokens with x0 >= threshold
};

/**
 * @brief Sort tokens top to bottom, then left to right
 *
 * Orders by (top, x0) ascending. The sort is stable so tokens with identical
 * coordinates keep their source order.
 */
void sortByPosition(std::vector<Token> &tokens);

/**
 * @brief Split page tokens into two column streams
 * @param tokens Page tokens in any order
 * @param xThreshold Tokens with x0 below this go to the left stream
 * @return Both streams, each sorted with sortByPosition()
 */
ColumnStreams splitColumns(const std::vector<Token> &tokens, double xThreshold);

/**
 * @brief Cluster a token stream into lines by vertical proximity
 *
 * Tokens are scanned in (top, x0) order. A token joins the current line when
 * its top is within yTolerance of the line's running y1, which then moves to
 * that token's top. Completed lines re-sort their tokens by x0; word tokens
 * are joined with a single space, character tokens are concatenated and the
 * result trimmed.
 *
 * @param tokens Token stream (sorted internally by (top, x0))
 * @param granularity Token granularity deciding the join rule
 * @param yTolerance Vertical tolerance in page points
 * @return Lines in top-to-bottom order; empty for an empty stream
 */
std::vector<Line> clusterLines(const std::vector<Token> &tokens,
                               TokenGranularity granularity,
                               double yTolerance = 3.0);

/**
 * @brief Group consecutive lines into paragraphs using an adaptive gap
 *
 * The reference spacing is the lower median of the gaps between consecutive
 * line midpoints. A gap larger than median * paragraphFactor starts a new
 * paragraph.
 *
 * @param lines Lines in top-to-bottom order
 * @param paragraphFactor Multiplier applied to the median gap
 * @return Paragraphs in top-to-bottom order, each with at least one line
 */
std::vector<Paragraph> segmentParagraphs(const std::vector<Line> &lines,
                                         double paragraphFactor = 1.5);

/**
 * @brief Median gap between consecutive line midpoints
 * @return Lower median of the gaps, or 0 when there are fewer than two lines
 */
double medianLineGap(const std::vector<Line> &lines);

/**
 * @brief Check whether text has the shape of a delegation header
 *
 * After trimming, the text must be non-empty and contain only uppercase
 * letters, spaces and slashes. Letters are classified by their Unicode
 * uppercase property, so "CÔTE" qualifies.
 */
bool isHeaderText(const std::string &text);

/**
 * @brief Delegation name of a header line: text before the first slash, trimmed
 *
 * "SWITZERLAND / SUISSE / SUIZA" becomes "SWITZERLAND".
 */
std::string delegationName(const std::string &text);

/**
 * @brief Check whether a paragraph is a header (one header-shaped line)
 */
bool isHeaderParagraph(const Paragraph &paragraph);

/**
 * @brief Collect the headers among a page's paragraphs
 * @return Headers sorted by midY ascending
 */
std::vector<Header> detectHeaders(const std::vector<Paragraph> &paragraphs);

/**
 * @brief Resolve the delegation owning a vertical position
 * @param headers Headers sorted by midY ascending
 * @param midY Midpoint of the paragraph being assigned
 * @return Name of the last header with midY <= the given midpoint, or an
 * empty string if no header lies above it
 */
std::string headerForMid(const std::vector<Header> &headers, double midY);

/**
 * @brief Check whether a page's tokens are spread over two columns
 *
 * True when both the left (x0 < xThreshold) and the right side hold at least
 * columnShare of the page's tokens. An empty page is never two-column.
 */
bool isTwoColumnPage(const std::vector<Token> &tokens, double xThreshold,
                     double columnShare = 0.25);

/**
 * @brief Decide the document layout from sampled pages
 *
 * Pages that failed extraction or carry no tokens are skipped. The first
 * page satisfying isTwoColumnPage() decides Two; otherwise Single.
 *
 * @param samplePages Token results of the first pages of the document
 * @param config Threshold and column share
 */
LayoutMode detectLayoutMode(const std::vector<PageTokens> &samplePages,
                            const LayoutConfig &config = LayoutConfig());

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
std::string trim(const std::string &text);

} // namespace roster

#endif // ROSTER_LAYOUT_ENGINE_HPP
