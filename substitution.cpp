#include "substitution.hpp"

#include <algorithm>

namespace
{
    struct Candidate {
        size_t start;
        size_t end;
        size_t pattern_index;
    };

    bool overlaps(const Candidate &c, const Span &s)
    {
        return c.start < s.end && s.start < c.end;
    }

    bool overlaps_any(const Candidate &c, const std::vector<Span> &spans)
    {
        for (const auto &s : spans)
        {
            if (s.start >= c.end)
                break;
            if (overlaps(c, s))
                return true;
        }
        return false;
    }
}

std::string make_marker(bool identify, uint32_t ordinal)
{
    if (!identify)
        return kRedactionMarker;
    return "<REDACTED:" + std::to_string(ordinal) + ">";
}

std::vector<Span> find_markers(const std::string &text)
{
    static const std::string open = "<REDACTED";

    std::vector<Span> markers;
    size_t pos = 0;
    while ((pos = text.find(open, pos)) != std::string::npos)
    {
        size_t i = pos + open.size();
        if (i < text.size() && text[i] == ':')
        {
            size_t digits = ++i;
            while (i < text.size() && text[i] >= '0' && text[i] <= '9')
                ++i;
            if (i == digits)
            {
                pos = digits;
                continue;
            }
        }
        if (i < text.size() && text[i] == '>')
        {
            markers.push_back({pos, i + 1});
            pos = i + 1;
        }
        else
        {
            pos += open.size();
        }
    }
    return markers;
}

RedactionResult apply_redaction(const SharedText &payload,
                                const PatternCatalog &catalog,
                                bool identify)
{
    RedactionResult result;
    result.text = payload;
    if (!payload || payload->empty())
        return result;

    const std::string &text = *payload;
    const auto &patterns = catalog.patterns();

    std::vector<Candidate> candidates;
    std::vector<Span> spans;
    for (size_t i = 0; i < patterns.size(); ++i)
    {
        spans.clear();
        patterns[i].find_all(text, spans);
        for (const auto &s : spans)
        {
            if (s.end > s.start)
                candidates.push_back({s.start, s.end, i});
        }
    }
    if (candidates.empty())
        return result;

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate &a, const Candidate &b) {
                  if (a.start != b.start)
                      return a.start < b.start;
                  if (a.end != b.end)
                      return a.end > b.end;
                  return a.pattern_index < b.pattern_index;
              });

    std::vector<Span> markers = find_markers(text);
    size_t last_end = 0;
    for (const auto &c : candidates)
    {
        if (c.start < last_end || overlaps_any(c, markers))
            continue;
        Match m;
        m.start = c.start;
        m.end = c.end;
        m.pattern_index = c.pattern_index;
        m.ordinal = static_cast<uint32_t>(result.matches.size());
        result.matches.push_back(m);
        last_end = c.end;
    }
    if (result.matches.empty())
        return result;

    std::string out;
    out.reserve(text.size() + result.matches.size() * 8);
    size_t last = 0;
    for (const auto &m : result.matches)
    {
        out.append(text, last, m.start - last);
        out += make_marker(identify, m.ordinal);
        last = m.end;
    }
    out.append(text, last);

    result.text = make_text(std::move(out));
    result.changed = true;
    return result;
}
