#include "http/header_merge.hpp"

namespace {

[[nodiscard]] boost::beast::string_view bsv(const std::string& s) noexcept
{
    return boost::beast::string_view{s.data(), s.size()};
}

// 키 단위 whole-value replace
void replace_fields(HttpFields& fields, std::initializer_list<const HeaderMap*> sources)
{
    for (const HeaderMap* source : sources) {
        if (source == nullptr) {
            continue;
        }
        for (const auto& [key, values] : *source) {
            fields.erase(bsv(key));
            for (const auto& value : values) {
                fields.insert(bsv(key), bsv(value));
            }
        }
    }
}

}  // namespace

void merge_request_headers(HttpRequest& request,
                           std::initializer_list<const HeaderMap*> sources)
{
    replace_fields(request, sources);
}

void merge_response_headers(HttpResponse& response,
                            std::initializer_list<const HeaderMap*> sources)
{
    replace_fields(response, sources);
}

void merge_sink_headers(ResponseSink& sink,
                        std::initializer_list<const HeaderMap*> sources)
{
    auto& fields = sink.header();
    for (const HeaderMap* source : sources) {
        if (source == nullptr) {
            continue;
        }
        for (const auto& [key, values] : *source) {
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i == 0) {
                    fields.set(bsv(key), bsv(values[i]));
                    continue;
                }
                fields.insert(bsv(key), bsv(values[i]));
            }
        }
    }
}

auto header_values(const HttpFields& fields, const std::string& key)
    -> std::vector<std::string>
{
    std::vector<std::string> out;
    const auto range = fields.equal_range(bsv(key));
    for (auto it = range.first; it != range.second; ++it) {
        out.emplace_back(it->value().data(), it->value().size());
    }
    return out;
}
