#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

class NFKCTextNormalizer : public ITextNormalizer
{
public:
    NFKCTextNormalizer() = default;
    ~NFKCTextNormalizer() override = default;

    NFKCTextNormalizer(const NFKCTextNormalizer&) = delete;
    NFKCTextNormalizer& operator=(const NFKCTextNormalizer&) = delete;

    [[nodiscard]] std::string normalize(std::string_view text) const override;
    [[nodiscard]] std::string collapseRepeats(std::string_view text, std::size_t max_run = 2) const override;
    [[nodiscard]] std::string leetUnmask(std::string_view text) const override;
    [[nodiscard]] std::string stripPunct(std::string_view text) const override;

private:
    [[nodiscard]] static std::string nfkc(const std::string& text);
};

} // namespace processing
