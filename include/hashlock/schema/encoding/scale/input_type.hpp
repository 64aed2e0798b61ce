#pragma once

#include <hashlock/schema/input_ref.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(hashlock::schema,
                             input_type_t,
                             hashlock::schema::input_type_t::public_data,
                             hashlock::schema::input_type_t::url,
                             hashlock::schema::input_type_t::private_url)
