#pragma once

#include "../processing/TextProcessingTypes.hpp"

#include <optional>
#include <string>

namespace moderation
{

// External reviewer of proposed flags. validate() returns the flags to keep, or std::nullopt
// when the reviewer is unavailable for any reason (transport error, non-2xx, bad payload).
class IFlagValidator
{
public:
    virtual ~IFlagValidator() = default;

    virtual bool isReady() const = 0;

    virtual std::optional<text_processing::FlagSet> validate(const std::string& transcript_id,
                                                             const text_processing::Segment& segment,
                                                             const text_processing::FlagSet& proposed) = 0;

    virtual const char* lastError() const = 0;
};

} // namespace moderation
