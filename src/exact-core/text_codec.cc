#include "text_codec.hh"

#include <exact-core/i128.hh>
#include <exact-core/u128.hh>

std::string ec::to_json(u128 v)
{
    return '"' + ec::to_string(v) + '"';
}

std::string ec::to_json(i128 v)
{
    return '"' + ec::to_string(v) + '"';
}

std::string ec::to_text(u128 v)
{
    return ec::to_string(v);
}

std::string ec::to_text(i128 v)
{
    return ec::to_string(v);
}
