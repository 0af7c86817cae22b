#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<bool> Diagnostics::redact_text_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

void Diagnostics::SetRedactText(bool enabled) noexcept
{
    redact_text_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsRedactingText() noexcept { return redact_text_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    if (IsRedactingText())
        return "<redacted " + std::to_string(text.size()) + " bytes>";

    std::size_t limit = std::min(text.size(), MaxPreview());
    // Never cut a UTF-8 sequence in half
    while (limit > 0 && limit < text.size() &&
           (static_cast<unsigned char>(text[limit]) & 0xC0u) == 0x80u)
    {
        --limit;
    }

    std::string out;
    out.reserve(limit + 24);
    out.push_back('"');
    for (char ch : text.substr(0, limit))
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '"':
            out += "\\\"";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    out.push_back('"');

    if (text.size() > limit)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return c < 0x20 || c == 0x7F;
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace processing
