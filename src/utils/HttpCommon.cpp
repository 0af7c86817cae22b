#include "HttpCommon.hpp"

#include <cpr/cpr.h>
#include <cctype>

namespace {

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{cfg.connect_timeout_ms});
    s.SetTimeout(cpr::Timeout{cfg.timeout_ms});
    if (cfg.cancel_flag)
    {
        // Returning false from the progress callback aborts the transfer
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool {
                auto flag = reinterpret_cast<std::atomic<bool>*>(userdata);
                return flag && flag->load();
            }, reinterpret_cast<intptr_t>(cfg.cancel_flag)));
    }
}

inline bool is_content_type(const std::string& name)
{
    static const char* ct = "Content-Type";
    if (name.size() != 12)
        return false;
    for (size_t i = 0; i < 12; ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
        char b = static_cast<char>(std::tolower(static_cast<unsigned char>(ct[i])));
        if (a != b)
            return false;
    }
    return true;
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (!has_ct && is_content_type(kv.name))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (!has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

} // namespace

namespace utils {

HttpResponse post_json(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{url});
    s.SetHeader(make_header(headers));
    s.SetBody(cpr::Body{body});
    apply_common(s, cfg);
    auto r = s.Post();
    HttpResponse hr;
    if (r.error) { hr.error = r.error.message; return hr; }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace utils
