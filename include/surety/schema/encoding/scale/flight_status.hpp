#pragma once

#include <surety/schema/flight_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(surety::schema,
                             flight_status_t,
                             surety::schema::flight_status_t::unknown,
                             surety::schema::flight_status_t::on_time,
                             surety::schema::flight_status_t::late_airline,
                             surety::schema::flight_status_t::late_weather,
                             surety::schema::flight_status_t::late_technical,
                             surety::schema::flight_status_t::late_other)
