#pragma once

#include "chunkyard/core/result.hpp"
#include "chunkyard/network/http_types.hpp"

#include <string>
#include <unordered_map>

namespace chunkyard {
namespace network {

using FormFields = std::unordered_map<std::string, std::string>;

/**
 * @brief A file field of a multipart/form-data body
 */
struct FilePart {
    std::string field_name;
    std::string filename;
    std::string content_type;
    std::string data;  // Raw bytes
};

/**
 * @brief Decoded form: plain fields plus file parts, both keyed by field name
 *
 * When a field name repeats, the first occurrence wins.
 */
struct FormData {
    FormFields fields;
    std::unordered_map<std::string, FilePart> files;

    const FilePart* file(const std::string& name) const {
        auto it = files.find(name);
        return it == files.end() ? nullptr : &it->second;
    }
};

/**
 * @brief Percent-decode one URL component ('+' becomes a space)
 *
 * Malformed escapes are kept literally.
 */
std::string url_decode(const std::string& text);

/**
 * @brief Decode "a=1&b=two" (application/x-www-form-urlencoded)
 */
FormFields parse_query_string(const std::string& query);

/**
 * @brief Extract the boundary parameter of a multipart Content-Type
 */
Result<std::string> multipart_boundary(const std::string& content_type);

/**
 * @brief Split a multipart/form-data body into fields and file parts
 *
 * Parts carrying a filename in Content-Disposition become FilePart entries;
 * the rest become text fields.
 */
Result<FormData> parse_multipart(const std::string& body, const std::string& boundary);

/**
 * @brief Decode every form field a request carries
 *
 * Query string parameters come first; the body is decoded according to its
 * Content-Type (multipart/form-data or application/x-www-form-urlencoded)
 * and its fields take precedence.
 */
Result<FormData> parse_form(const HttpRequest& request);

} // namespace network
} // namespace chunkyard
