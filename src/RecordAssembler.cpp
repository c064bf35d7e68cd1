#include "RecordAssembler.hpp"

#include <initializer_list>
#include <utility>

namespace roster {

namespace {

std::string joinTrimmed(std::vector<std::string>::const_iterator begin,
                        std::vector<std::string>::const_iterator end) {
  std::string joined;
  for (auto it = begin; it != end; ++it) {
    if (it != begin) {
      joined += ' ';
    }
    joined += trim(*it);
  }
  return trim(joined);
}

} // anonymous namespace

SingleColumnStrategy::SingleColumnStrategy(const LayoutConfig &config,
                                           const HonorificParser &parser)
    : m_config(config), m_parser(parser) {}

std::vector<Record>
SingleColumnStrategy::assemblePage(const std::vector<Token> &tokens) const {
  if (tokens.empty()) {
    return {};
  }
  return assembleLines(
      clusterLines(tokens, granularity(), m_config.yTolerance));
}

std::vector<Record>
SingleColumnStrategy::assembleLines(const std::vector<Line> &lines) const {
  std::vector<Record> records;
  std::string delegation;

  size_t i = 0;
  while (i < lines.size()) {
    const Line &line = lines[i];
    std::string text = trim(line.text);

    if (line.isBold && !text.empty()) {
      delegation = delegationName(text);
      ++i;
      continue;
    }

    if (delegation.empty() || text.empty()) {
      ++i;
      continue;
    }

    HonorificMatch name = m_parser.parse(text);
    ++i;

    std::vector<std::string> affiliation;
    while (i < lines.size() && !lines[i].isBold &&
           !trim(lines[i].text).empty()) {
      affiliation.push_back(lines[i].text);
      ++i;
    }

    Record record;
    record.delegation = delegation;
    record.honorific = name.honorific;
    record.personName = name.person;
    record.affiliation = joinTrimmed(affiliation.begin(), affiliation.end());
    records.push_back(std::move(record));
  }

  return records;
}

TwoColumnStrategy::TwoColumnStrategy(const LayoutConfig &config,
                                     const HonorificParser &parser)
    : m_config(config), m_parser(parser) {}

std::vector<Header>
TwoColumnStrategy::pageHeaders(const std::vector<Token> &tokens) const {
  std::vector<Line> lines =
      clusterLines(tokens, granularity(), m_config.yTolerance);
  return detectHeaders(segmentParagraphs(lines, m_config.paragraphFactor));
}

std::vector<Record>
TwoColumnStrategy::assemblePage(const std::vector<Token> &tokens) const {
  if (tokens.empty()) {
    return {};
  }

  // Headers may span both columns, so they come from the whole page
  std::vector<Header> headers = pageHeaders(tokens);

  ColumnStreams streams = splitColumns(tokens, m_config.xThreshold);
  std::vector<std::vector<Paragraph>> columns;
  for (const auto *stream : {&streams.left, &streams.right}) {
    std::vector<Line> lines =
        clusterLines(*stream, granularity(), m_config.yTolerance);
    columns.push_back(segmentParagraphs(lines, m_config.paragraphFactor));
  }

  return assembleColumns(headers, columns);
}

std::vector<Record> TwoColumnStrategy::assembleColumns(
    const std::vector<Header> &headers,
    const std::vector<std::vector<Paragraph>> &columns) const {
  std::vector<Record> records;

  for (const auto &paragraphs : columns) {
    for (const auto &paragraph : paragraphs) {
      if (paragraph.lines.empty() || isHeaderParagraph(paragraph)) {
        continue;
      }

      HonorificMatch name = m_parser.parse(paragraph.lines.front());

      Record record;
      record.delegation = headerForMid(headers, paragraph.midY());
      record.honorific = name.honorific;
      record.personName = name.person;
      record.affiliation =
          joinTrimmed(paragraph.lines.begin() + 1, paragraph.lines.end());
      records.push_back(std::move(record));
    }
  }

  return records;
}

RecordAssembler::RecordAssembler(LayoutMode mode, const LayoutConfig &config,
                                 const HonorificParser &parser)
    : m_strategy(selectStrategy(mode, true, config, parser)) {}

RecordAssembler::RecordAssembler(AssemblyStrategy strategy)
    : m_strategy(std::move(strategy)) {}

AssemblyStrategy RecordAssembler::selectStrategy(LayoutMode mode,
                                                 bool hasFontWeight,
                                                 const LayoutConfig &config,
                                                 const HonorificParser &parser) {
  if (mode == LayoutMode::Single && hasFontWeight) {
    return SingleColumnStrategy(config, parser);
  }
  return TwoColumnStrategy(config, parser);
}

TokenGranularity RecordAssembler::granularity() const {
  return std::visit(
      [](const auto &strategy) { return strategy.granularity(); },
      m_strategy);
}

LayoutMode RecordAssembler::mode() const {
  return std::holds_alternative<SingleColumnStrategy>(m_strategy)
             ? LayoutMode::Single
             : LayoutMode::Two;
}

std::vector<Record>
RecordAssembler::assemblePage(const std::vector<Token> &tokens) const {
  return std::visit(
      [&tokens](const auto &strategy) { return strategy.assemblePage(tokens); },
      m_strategy);
}

} // namespace roster
