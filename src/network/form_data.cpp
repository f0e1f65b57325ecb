#include "chunkyard/network/form_data.hpp"

#include <cctype>

namespace chunkyard {
namespace network {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_lower(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

/**
 * @brief Find parameter `key` in a header value like
 *        form-data; name="file"; filename="a.bin"
 */
std::string header_parameter(const std::string& header, const std::string& key) {
    size_t pos = 0;
    while (pos < header.size()) {
        size_t semi = header.find(';', pos);
        if (semi == std::string::npos) {
            break;
        }
        pos = semi + 1;

        const size_t eq = header.find('=', pos);
        if (eq == std::string::npos) {
            break;
        }
        const std::string name = to_lower(trim(header.substr(pos, eq - pos)));

        size_t value_start = eq + 1;
        while (value_start < header.size() && header[value_start] == ' ') {
            ++value_start;
        }

        std::string value;
        size_t next = value_start;
        if (value_start < header.size() && header[value_start] == '"') {
            const size_t close = header.find('"', value_start + 1);
            if (close == std::string::npos) {
                value = header.substr(value_start + 1);
                next = header.size();
            } else {
                value = header.substr(value_start + 1, close - value_start - 1);
                next = close + 1;
            }
        } else {
            const size_t stop = header.find(';', value_start);
            value = trim(header.substr(value_start, stop == std::string::npos ? std::string::npos
                                                                              : stop - value_start));
            next = stop == std::string::npos ? header.size() : stop;
        }

        if (name == key) {
            return value;
        }
        pos = next;
    }
    return "";
}

bool has_parameter(const std::string& header, const std::string& key) {
    const std::string lowered = to_lower(header);
    const std::string needle = key + "=";
    size_t pos = lowered.find(needle);
    while (pos != std::string::npos) {
        // Make sure we matched "filename=" and not "xfilename="
        if (pos == 0 || lowered[pos - 1] == ' ' || lowered[pos - 1] == ';') {
            return true;
        }
        pos = lowered.find(needle, pos + 1);
    }
    return false;
}

} // namespace

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size()) {
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high < 0 || low < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>(high * 16 + low);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

FormFields parse_query_string(const std::string& query) {
    FormFields fields;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        const std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            const size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
            fields.emplace(std::move(key), std::move(value));
        }
        pos = amp + 1;
    }
    return fields;
}

Result<std::string> multipart_boundary(const std::string& content_type) {
    if (to_lower(trim(content_type)).rfind("multipart/form-data", 0) != 0) {
        return Err<std::string>(ErrorCode::MalformedRequest, "Content-Type is not multipart/form-data");
    }
    std::string boundary = header_parameter(content_type, "boundary");
    if (boundary.empty()) {
        return Err<std::string>(ErrorCode::MalformedRequest, "multipart/form-data without boundary");
    }
    return Ok(boundary);
}

Result<FormData> parse_multipart(const std::string& body, const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    const std::string part_end = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        return Err<FormData>(ErrorCode::MalformedRequest, "multipart body has no opening boundary");
    }
    pos += delimiter.size();

    FormData form;
    while (true) {
        if (body.compare(pos, 2, "--") == 0) {
            return Ok(form);  // Closing delimiter
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            return Err<FormData>(ErrorCode::MalformedRequest, "malformed multipart boundary line");
        }
        pos += 2;

        const size_t headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string::npos) {
            return Err<FormData>(ErrorCode::MalformedRequest, "multipart part without header terminator");
        }

        std::string disposition;
        std::string content_type;
        size_t line_start = pos;
        while (line_start < headers_end) {
            size_t line_end = body.find("\r\n", line_start);
            if (line_end == std::string::npos || line_end > headers_end) {
                line_end = headers_end;
            }
            const std::string line = body.substr(line_start, line_end - line_start);
            const size_t colon = line.find(':');
            if (colon != std::string::npos) {
                const std::string name = to_lower(trim(line.substr(0, colon)));
                const std::string value = trim(line.substr(colon + 1));
                if (name == "content-disposition") {
                    disposition = value;
                } else if (name == "content-type") {
                    content_type = value;
                }
            }
            line_start = line_end + 2;
        }

        const size_t data_start = headers_end + 4;
        const size_t data_end = body.find(part_end, data_start);
        if (data_end == std::string::npos) {
            return Err<FormData>(ErrorCode::MalformedRequest, "multipart part is not terminated");
        }

        const std::string field_name = header_parameter(disposition, "name");
        if (field_name.empty()) {
            return Err<FormData>(ErrorCode::MalformedRequest, "multipart part without a field name");
        }

        if (has_parameter(disposition, "filename")) {
            FilePart part;
            part.field_name = field_name;
            part.filename = header_parameter(disposition, "filename");
            part.content_type = content_type;
            part.data = body.substr(data_start, data_end - data_start);
            form.files.emplace(field_name, std::move(part));
        } else {
            form.fields.emplace(field_name, body.substr(data_start, data_end - data_start));
        }

        pos = data_end + part_end.size();
    }
}

Result<FormData> parse_form(const HttpRequest& request) {
    FormData form;
    const FormFields query = parse_query_string(request.query_string());

    const std::string content_type = request.get_header("Content-Type");
    const std::string lowered = to_lower(content_type);

    if (lowered.rfind("multipart/form-data", 0) == 0) {
        auto boundary = multipart_boundary(content_type);
        if (boundary.is_error()) {
            return Err<FormData>(boundary.error());
        }
        auto parsed = parse_multipart(request.body_as_string(), boundary.value());
        if (parsed.is_error()) {
            return parsed;
        }
        form = std::move(parsed.value());
    } else if (lowered.rfind("application/x-www-form-urlencoded", 0) == 0) {
        form.fields = parse_query_string(request.body_as_string());
    }

    // Body fields win; emplace leaves them in place
    for (const auto& [key, value] : query) {
        form.fields.emplace(key, value);
    }
    return Ok(form);
}

} // namespace network
} // namespace chunkyard
