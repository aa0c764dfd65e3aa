#pragma once

#include <surety/schema/airline_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(surety::schema,
                             airline_status_t,
                             surety::schema::airline_status_t::unknown,
                             surety::schema::airline_status_t::pending,
                             surety::schema::airline_status_t::registered)
