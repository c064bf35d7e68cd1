#include "LayoutEngine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <utility>

// ICU character properties for header classification
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace roster {

namespace {

const char *const kWhitespace = " \t\n\r\f\v";

Line buildLine(std::vector<Token> &members, double y0, double y1,
               TokenGranularity granularity) {
  std::stable_sort(members.begin(), members.end(),
                   [](const Token &a, const Token &b) { return a.x0 < b.x0; });

  Line line;
  line.y0 = y0;
  line.y1 = y1;

  for (size_t i = 0; i < members.size(); ++i) {
    if (granularity == TokenGranularity::Word && i > 0) {
      line.text += ' ';
    }
    line.text += members[i].text;
    line.isBold = line.isBold || members[i].isBold;
  }

  // Glyph streams carry their own space glyphs, so only the ends need work
  if (granularity == TokenGranularity::Character) {
    line.text = trim(line.text);
  }

  return line;
}

} // anonymous namespace

std::string trim(const std::string &text) {
  size_t start = text.find_first_not_of(kWhitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(kWhitespace);
  return text.substr(start, end - start + 1);
}

void sortByPosition(std::vector<Token> &tokens) {
  std::stable_sort(tokens.begin(), tokens.end(),
                   [](const Token &a, const Token &b) {
                     if (a.top != b.top) {
                       return a.top < b.top;
                     }
                     return a.x0 < b.x0;
                   });
}

ColumnStreams splitColumns(const std::vector<Token> &tokens,
                           double xThreshold) {
  ColumnStreams streams;

  for (const auto &token : tokens) {
    if (token.x0 < xThreshold) {
      streams.left.push_back(token);
    } else {
      streams.right.push_back(token);
    }
  }

  sortByPosition(streams.left);
  sortByPosition(streams.right);
  return streams;
}

std::vector<Line> clusterLines(const std::vector<Token> &tokens,
                               TokenGranularity granularity,
                               double yTolerance) {
  std::vector<Line> lines;
  if (tokens.empty()) {
    return lines;
  }

  std::vector<Token> sorted = tokens;
  sortByPosition(sorted);

  std::vector<Token> current;
  current.push_back(sorted.front());
  double y0 = sorted.front().top;
  double y1 = y0;

  for (size_t i = 1; i < sorted.size(); ++i) {
    const Token &token = sorted[i];

    if (std::abs(token.top - y1) <= yTolerance) {
      current.push_back(token);
      y1 = token.top;
      continue;
    }

    lines.push_back(buildLine(current, y0, y1, granularity));
    current.clear();
    current.push_back(token);
    y0 = y1 = token.top;
  }

  lines.push_back(buildLine(current, y0, y1, granularity));
  return lines;
}

double medianLineGap(const std::vector<Line> &lines) {
  if (lines.size() < 2) {
    return 0.0;
  }

  std::vector<double> gaps;
  gaps.reserve(lines.size() - 1);
  for (size_t i = 1; i < lines.size(); ++i) {
    gaps.push_back(lines[i].midY() - lines[i - 1].midY());
  }

  std::sort(gaps.begin(), gaps.end());
  return gaps[(gaps.size() - 1) / 2];
}

std::vector<Paragraph> segmentParagraphs(const std::vector<Line> &lines,
                                         double paragraphFactor) {
  std::vector<Paragraph> paragraphs;
  if (lines.empty()) {
    return paragraphs;
  }

  const double threshold = medianLineGap(lines) * paragraphFactor;

  Paragraph current;
  for (size_t i = 0; i < lines.size(); ++i) {
    const Line &line = lines[i];

    if (i > 0 && !current.lines.empty() &&
        (line.midY() - lines[i - 1].midY()) > threshold) {
      paragraphs.push_back(std::move(current));
      current = Paragraph();
    }

    if (current.lines.empty()) {
      current.y0 = line.y0;
    }
    current.lines.push_back(line.text);
    current.y1 = line.y1;
  }

  if (!current.lines.empty()) {
    paragraphs.push_back(std::move(current));
  }

  return paragraphs;
}

bool isHeaderText(const std::string &text) {
  std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return false;
  }

  const auto *bytes = reinterpret_cast<const uint8_t *>(trimmed.data());
  const int32_t length = static_cast<int32_t>(trimmed.size());
  int32_t offset = 0;

  while (offset < length) {
    UChar32 c;
    U8_NEXT(bytes, offset, length, c);

    if (c < 0) {
      return false; // malformed UTF-8
    }
    if (c == ' ' || c == '/') {
      continue;
    }
    if (!u_isUUppercase(c)) {
      return false;
    }
  }

  return true;
}

std::string delegationName(const std::string &text) {
  return trim(text.substr(0, text.find('/')));
}

bool isHeaderParagraph(const Paragraph &paragraph) {
  return paragraph.lines.size() == 1 && isHeaderText(paragraph.lines.front());
}

std::vector<Header> detectHeaders(const std::vector<Paragraph> &paragraphs) {
  std::vector<Header> headers;

  for (const auto &paragraph : paragraphs) {
    if (isHeaderParagraph(paragraph)) {
      headers.push_back(
          Header{delegationName(paragraph.lines.front()), paragraph.midY()});
    }
  }

  std::stable_sort(
      headers.begin(), headers.end(),
      [](const Header &a, const Header &b) { return a.midY < b.midY; });
  return headers;
}

std::string headerForMid(const std::vector<Header> &headers, double midY) {
  // First header strictly below the midpoint; the one before it owns it
  auto it = std::upper_bound(
      headers.begin(), headers.end(), midY,
      [](double value, const Header &header) { return value < header.midY; });

  if (it == headers.begin()) {
    return "";
  }
  return std::prev(it)->name;
}

bool isTwoColumnPage(const std::vector<Token> &tokens, double xThreshold,
                     double columnShare) {
  if (tokens.empty()) {
    return false;
  }

  size_t left = 0;
  size_t right = 0;
  for (const auto &token : tokens) {
    if (token.x0 < xThreshold) {
      ++left;
    } else {
      ++right;
    }
  }

  const double total = static_cast<double>(left + right);
  return left / total >= columnShare && right / total >= columnShare;
}

LayoutMode detectLayoutMode(const std::vector<PageTokens> &samplePages,
                            const LayoutConfig &config) {
  for (const auto &page : samplePages) {
    if (!page.success || page.tokens.empty()) {
      continue;
    }
    if (isTwoColumnPage(page.tokens, config.xThreshold, config.columnShare)) {
      return LayoutMode::Two;
    }
  }
  return LayoutMode::Single;
}

} // namespace roster
