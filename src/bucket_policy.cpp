#include "bucket_policy.hpp"

#include <sstream>

namespace cog_converter {

std::string public_read_policy(const std::string& bucket) {
    std::ostringstream os;
    os << "{\"Version\":\"2012-10-17\",\"Statement\":[{"
       << "\"Sid\":\"PublicRead\",\"Effect\":\"Allow\",\"Principal\":\"*\","
       << "\"Action\":[\"s3:GetObject\"],"
       << "\"Resource\":[\"arn:aws:s3:::" << bucket << "/*\"]}]}";
    return os.str();
}

std::string cors_allow_all_configuration() {
    std::ostringstream os;
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
       << "<CORSConfiguration xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
       << "<CORSRule>"
       << "<AllowedOrigin>*</AllowedOrigin>"
       << "<AllowedMethod>GET</AllowedMethod>"
       << "<AllowedMethod>HEAD</AllowedMethod>"
       << "<AllowedHeader>*</AllowedHeader>"
       << "<ExposeHeader>Accept-Ranges</ExposeHeader>"
       << "<ExposeHeader>Content-Range</ExposeHeader>"
       << "<ExposeHeader>Content-Length</ExposeHeader>"
       << "<ExposeHeader>ETag</ExposeHeader>"
       << "<MaxAgeSeconds>3000</MaxAgeSeconds>"
       << "</CORSRule>"
       << "</CORSConfiguration>";
    return os.str();
}

}  // namespace cog_converter
