/*
 * descriptor.hpp - Descriptor protocol field helpers
 *
 * The host reads one record per line on stdout, each record a keyword
 * followed by {name=value} fields in a fixed order:
 *
 *     arg {number=0}{call=--port}{display=Port}{type=unsigned}{default=5555}
 *
 * Optional fields are left out entirely when unset, never written empty.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

// {name=value}
void write_field(std::ostream& out, const char* name, const std::string& value);
void write_field(std::ostream& out, const char* name, uint64_t value);

// {name=value} if set, nothing otherwise
void write_opt_field(std::ostream& out, const char* name, const std::optional<std::string>& value);

// {name=true} / {name=false} if set, nothing otherwise
void write_opt_field(std::ostream& out, const char* name, const std::optional<bool>& value);
