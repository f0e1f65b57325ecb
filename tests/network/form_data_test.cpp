#include "chunkyard/network/form_data.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace chunkyard::network;

namespace {

const std::string kBoundary = "----chunkyardBoundary7MA4YWxk";

std::string multipart_body(const std::string& chunk_bytes) {
    std::string body;
    body += "--" + kBoundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"flowChunkNumber\"\r\n\r\n";
    body += "1\r\n";
    body += "--" + kBoundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"flowIdentifier\"\r\n\r\n";
    body += "abc123\r\n";
    body += "--" + kBoundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"blob\"\r\n";
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body += chunk_bytes + "\r\n";
    body += "--" + kBoundary + "--\r\n";
    return body;
}

HttpRequest request_with(const std::string& url, const std::string& content_type, const std::string& body) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    if (!content_type.empty()) {
        request.headers["Content-Type"] = content_type;
    }
    request.body.assign(body.begin(), body.end());
    return request;
}

} // namespace

TEST(FormDataTest, UrlDecodeHandlesEscapesAndPlus) {
    EXPECT_EQ(url_decode("a%20b+c"), "a b c");
    EXPECT_EQ(url_decode("%2Fetc%2fpasswd"), "/etc/passwd");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
}

TEST(FormDataTest, ParsesQueryString) {
    auto fields = parse_query_string("flowChunkNumber=2&flowFilename=my+file.txt&empty=&flag");

    EXPECT_EQ(fields["flowChunkNumber"], "2");
    EXPECT_EQ(fields["flowFilename"], "my file.txt");
    EXPECT_EQ(fields["empty"], "");
    EXPECT_TRUE(fields.count("flag"));
}

TEST(FormDataTest, ExtractsBoundary) {
    auto quoted = multipart_boundary("multipart/form-data; boundary=\"abc def\"");
    ASSERT_TRUE(quoted.is_ok());
    EXPECT_EQ(quoted.value(), "abc def");

    auto plain = multipart_boundary("Multipart/Form-Data; charset=utf-8; boundary=xyz");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value(), "xyz");

    EXPECT_TRUE(multipart_boundary("multipart/form-data").is_error());
    EXPECT_TRUE(multipart_boundary("application/json").is_error());
}

TEST(FormDataTest, SplitsFieldsAndFileParts) {
    auto form = parse_multipart(multipart_body("XYZ"), kBoundary);

    ASSERT_TRUE(form.is_ok()) << form.error().message;
    EXPECT_EQ(form.value().fields.at("flowChunkNumber"), "1");
    EXPECT_EQ(form.value().fields.at("flowIdentifier"), "abc123");

    const FilePart* file = form.value().file("file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->filename, "blob");
    EXPECT_EQ(file->content_type, "application/octet-stream");
    EXPECT_EQ(file->data, "XYZ");
}

TEST(FormDataTest, FilePartIsBinarySafe) {
    std::string bytes("a\0b\r\nc", 6);
    bytes += "--not-the-boundary";

    auto form = parse_multipart(multipart_body(bytes), kBoundary);

    ASSERT_TRUE(form.is_ok()) << form.error().message;
    EXPECT_EQ(form.value().file("file")->data, bytes);
}

TEST(FormDataTest, TruncatedBodyIsRejected) {
    std::string body = multipart_body("XYZ");
    body.resize(body.size() / 2);

    auto form = parse_multipart(body, kBoundary);

    ASSERT_TRUE(form.is_error());
    EXPECT_EQ(form.error().code, chunkyard::ErrorCode::MalformedRequest);
}

TEST(FormDataTest, MissingOpeningBoundaryIsRejected) {
    EXPECT_TRUE(parse_multipart("just some bytes", kBoundary).is_error());
}

TEST(FormDataTest, ParseFormMergesQueryAndBody) {
    auto request = request_with("/upload?flowChunkNumber=9&flowTotalChunks=4",
                                "multipart/form-data; boundary=" + kBoundary,
                                multipart_body("XYZ"));

    auto form = parse_form(request);

    ASSERT_TRUE(form.is_ok()) << form.error().message;
    EXPECT_EQ(form.value().fields.at("flowChunkNumber"), "1");  // body wins
    EXPECT_EQ(form.value().fields.at("flowTotalChunks"), "4");
    ASSERT_NE(form.value().file("file"), nullptr);
}

TEST(FormDataTest, ParseFormDecodesUrlEncodedBody) {
    auto request = request_with("/upload", "application/x-www-form-urlencoded",
                                "flowIdentifier=a%2Bb&flowFilename=x.txt");

    auto form = parse_form(request);

    ASSERT_TRUE(form.is_ok());
    EXPECT_EQ(form.value().fields.at("flowIdentifier"), "a+b");
    EXPECT_TRUE(form.value().files.empty());
}
