#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/throw_exception.hpp>
#include <algorithm>
#include <cctype>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
using namespace boost::archive::iterators;

typedef base64_from_binary<transform_width<string::const_iterator, 6, 8>> base64_text;
typedef transform_width<binary_from_base64<string::const_iterator>, 8, 6> base64_binary;

string base64_encode(const string &bytes) {
    string text(base64_text(bytes.begin()), base64_text(bytes.end()));
    text.append((3 - bytes.size() % 3) % 3, '=');
    return text;
}

string base64_decode(const string &input) {
    string text;
    text.reserve(input.size());
    for (char c : input)
        if (!isspace(static_cast<unsigned char>(c))) text.push_back(c);

    if (text.size() % 4 != 0)
        BOOST_THROW_EXCEPTION(invalid_argument_error("base64 content has invalid length"));

    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=') ++padding;
    text.resize(text.size() - padding);

    bool valid = all_of(text.begin(), text.end(), [](char c) {
        return isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
    });
    if (!valid)
        BOOST_THROW_EXCEPTION(invalid_argument_error("base64 content contains invalid characters"));

    // binary_from_base64 不接受 '='，先补 'A' 解码，再去掉多出的字节
    text.append(padding, 'A');
    string bytes(base64_binary(text.begin()), base64_binary(text.end()));
    bytes.resize(bytes.size() - padding);
    return bytes;
}

}  // namespace tci
