#ifndef ROSTER_RECORD_ASSEMBLER_HPP
#define ROSTER_RECORD_ASSEMBLER_HPP

#include "Honorifics.hpp"
#include "LayoutEngine.hpp"
#include "RosterTypes.hpp"

#include <variant>
#include <vector>

namespace roster {

/**
 * @brief Single-column rosters whose delegations are set in bold
 *
 * Works on glyph tokens carrying font weight. A bold line opens a delegation,
 * the next plain line is a person and the plain lines directly under it are
 * the affiliation.
 */
class SingleColumnStrategy {
public:
  SingleColumnStrategy(const LayoutConfig &config,
                       const HonorificParser &parser);

  TokenGranularity granularity() const { return TokenGranularity::Character; }

  /**
   * @brief Build the records of one page from its tokens
   */
  std::vector<Record> assemblePage(const std::vector<Token> &tokens) const;

  /**
   * @brief Walk the lines of one page and emit one record per person
   *
   * Lines before the first bold line are skipped. A blank or bold line ends
   * the affiliation of the current person.
   */
  std::vector<Record> assembleLines(const std::vector<Line> &lines) const;

private:
  LayoutConfig m_config;
  HonorificParser m_parser;
};

/**
 * @brief Two-column rosters with all-caps delegation headers
 *
 * Also used for OCR transcripts, which carry no font weight. Headers are
 * detected over the whole page, then each column's paragraphs become one
 * record each and take the delegation of the nearest header above them.
 */
class TwoColumnStrategy {
public:
  TwoColumnStrategy(const LayoutConfig &config, const HonorificParser &parser);

  TokenGranularity granularity() const { return TokenGranularity::Word; }

  /**
   * @brief Build the records of one page from its word tokens
   */
  std::vector<Record> assemblePage(const std::vector<Token> &tokens) const;

  /**
   * @brief Detect the page-global delegation headers
   * @return Headers sorted by midY
   */
  std::vector<Header> pageHeaders(const std::vector<Token> &tokens) const;

  /**
   * @brief Turn column paragraphs into records
   * @param headers Page-global headers sorted by midY
   * @param columns Paragraphs per column, left column first
   */
  std::vector<Record>
  assembleColumns(const std::vector<Header> &headers,
                  const std::vector<std::vector<Paragraph>> &columns) const;

private:
  LayoutConfig m_config;
  HonorificParser m_parser;
};

using AssemblyStrategy = std::variant<SingleColumnStrategy, TwoColumnStrategy>;

/**
 * @brief Turns page tokens into records with the strategy fitting the layout
 *
 * Example usage:
 * @code
 * roster::RecordAssembler assembler(roster::LayoutMode::Two);
 * auto records = assembler.assemblePage(pageTokens);
 * @endcode
 */
class RecordAssembler {
public:
  explicit RecordAssembler(LayoutMode mode,
                           const LayoutConfig &config = LayoutConfig(),
                           const HonorificParser &parser = HonorificParser());

  /**
   * @brief Pick the strategy for a layout
   *
   * Single-column documents need font weight, so the bold-header strategy is
   * only chosen when the source can deliver glyph tokens; everything else,
   * OCR transcripts included, goes through the two-column strategy.
   *
   * @param mode Detected or forced layout
   * @param hasFontWeight Whether the token source reports bold glyphs
   */
  static AssemblyStrategy selectStrategy(LayoutMode mode, bool hasFontWeight,
                                         const LayoutConfig &config,
                                         const HonorificParser &parser);

  explicit RecordAssembler(AssemblyStrategy strategy);

  /**
   * @brief Token granularity the selected strategy expects
   */
  TokenGranularity granularity() const;

  /**
   * @brief Layout handled by the selected strategy
   */
  LayoutMode mode() const;

  /**
   * @brief Build the records of one page; an empty page yields none
   */
  std::vector<Record> assemblePage(const std::vector<Token> &tokens) const;

private:
  AssemblyStrategy m_strategy;
};

} // namespace roster

#endif // ROSTER_RECORD_ASSEMBLER_HPP
