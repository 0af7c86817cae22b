#include "Lexicon.hpp"
#include "NFKCTextNormalizer.hpp"
#include "Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace processing
{

namespace
{

std::vector<std::string> readStringArray(const json& doc, const char* key)
{
    std::vector<std::string> out;
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_array())
        return out;

    for (const auto& item : *it)
    {
        if (item.is_string())
            out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

Lexicon::Lexicon(const std::vector<std::string>& terms, const std::vector<std::string>& whitelist)
{
    NFKCTextNormalizer normalizer;

    std::unordered_set<std::string> seen_safe;
    for (const auto& word : whitelist)
    {
        std::string norm = normalizer.normalize(word);
        if (norm.empty() || !seen_safe.insert(norm).second)
            continue;
        whitelist_.push_back(std::move(norm));
    }

    std::unordered_set<std::string> seen_terms;
    entries_.reserve(terms.size());
    for (const auto& term : terms)
    {
        std::string norm = normalizer.normalize(term);
        if (norm.empty() || seen_safe.count(norm) != 0)
            continue;
        if (!seen_terms.insert(norm).second)
            continue;

        LexiconEntry entry;
        entry.term = term;
        entry.is_phrase = norm.find(' ') != std::string::npos;
        entry.normalized = std::move(norm);
        entries_.push_back(std::move(entry));
    }
}

const std::vector<std::string>& Lexicon::defaultTerms()
{
    static const std::vector<std::string> terms = {
        "fuck", "fucks", "fucked", "fucking", "motherfucker", "mf",
        "hell", "hells",
        "what the fuck", "what the hell", "what the shit", "what the ass",
        "what the dick", "what the cock", "what the pussy",
        "shit", "shitty", "bullshit",
        "wtf", "tf", "stfu", "gtfo",
        "ass", "asshole", "dumbass", "jackass",
        "bitch", "bitches", "bastard",
        "dick", "dicks", "dickhead",
        "cock", "cocks", "cocksucker",
        "pussy", "slut", "whore", "piss",
        "crap", "damn", "dammit",
        "suck my dick", "go to hell", "screw you",
        "fuk", "f*ck", "f**k", "fu", "f u", "fukn", "fkn", "fkin", "fking",
        "sht", "sh*t", "af",
    };
    return terms;
}

const std::vector<std::string>& Lexicon::defaultWhitelist()
{
    // Classic substring false positives
    static const std::vector<std::string> whitelist = { "assess", "classic", "passion", "scunthorpe" };
    return whitelist;
}

std::shared_ptr<const Lexicon> Lexicon::builtin()
{
    static const std::shared_ptr<const Lexicon> instance =
        std::make_shared<const Lexicon>(defaultTerms(), defaultWhitelist());
    return instance;
}

std::optional<Lexicon> Lexicon::loadFromFile(const std::string& file_path)
{
    std::error_code ec;
    if (!fs::exists(file_path, ec))
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[Lexicon] File not found: " << file_path;
        return std::nullopt;
    }

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[Lexicon] Cannot open: " << file_path;
        return std::nullopt;
    }

    json doc;
    try
    {
        file >> doc;
    }
    catch (const json::exception& e)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[Lexicon] JSON parse error in " << file_path << ": " << e.what();
        return std::nullopt;
    }

    if (!doc.is_object())
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[Lexicon] Expected a JSON object in " << file_path;
        return std::nullopt;
    }

    Lexicon lexicon(readStringArray(doc, "terms"), readStringArray(doc, "whitelist"));
    if (lexicon.empty())
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[Lexicon] No usable terms in " << file_path;
        return std::nullopt;
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[Lexicon] Loaded " << lexicon.size() << " terms and "
                                          << lexicon.whitelist().size() << " whitelist entries from " << file_path;
    return lexicon;
}

std::shared_ptr<const Lexicon> Lexicon::loadOrBuiltin(const std::optional<std::string>& file_path)
{
    if (!file_path || file_path->empty())
        return builtin();

    if (auto loaded = loadFromFile(*file_path))
        return std::make_shared<const Lexicon>(std::move(*loaded));

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Lexicon,
                                        "Lexicon file unusable, falling back to built-in lexicon", *file_path);
    return builtin();
}

} // namespace processing
