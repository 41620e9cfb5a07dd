#pragma once

#include <tao/pegtl.hpp>

namespace tabula::net::grammar {

namespace pegtl = tao::pegtl;

struct component_separator : pegtl::one<'.', '/', ':', '@'> {
};

struct range_first : pegtl::plus<pegtl::digit> {
};

struct range_last : pegtl::plus<pegtl::digit> {
};

// "<first>-<last>" must also end a component; whether it starts one is decided by the action.
struct range_token
    : pegtl::seq<range_first, pegtl::one<'-'>, range_last, pegtl::at<pegtl::sor<pegtl::eof, component_separator>>> {
};

struct digit_run : pegtl::plus<pegtl::digit> {
};

struct literal_char : pegtl::any {
};

struct endpoint_element : pegtl::sor<range_token, digit_run, literal_char> {
};

struct endpoint_spec : pegtl::seq<pegtl::star<endpoint_element>, pegtl::eof> {
};

struct version_number : pegtl::plus<pegtl::digit> {
};

struct product_name : pegtl::plus<pegtl::not_one<' '>> {
};

struct server_version
    : pegtl::seq<version_number,
                 pegtl::one<'.'>,
                 version_number,
                 pegtl::one<'.'>,
                 version_number,
                 pegtl::one<'.'>,
                 version_number> {
};

// "<product> <major>.<minor>.<patch>.<protocol>", nothing after it.
struct server_banner : pegtl::seq<product_name, pegtl::one<' '>, server_version, pegtl::eof> {
};

}  // namespace tabula::net::grammar
