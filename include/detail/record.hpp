// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>

namespace medreduce {

// one electronic health record, one per line of input:
//   <patient id> <first name> <last name> <age> <diagnosis> <treatment>
struct record
{
    std::string patient_id;
    std::string name;
    std::string age;
    std::string diagnosis;
    std::string treatment;
};

inline bool const operator==(record const &first, record const &second)
{
    return first.patient_id == second.patient_id
        && first.name       == second.name
        && first.age        == second.age
        && first.diagnosis  == second.diagnosis
        && first.treatment  == second.treatment;
}

inline bool const operator!=(record const &first, record const &second)
{
    return !(first == second);
}

namespace detail {

size_t const record_fields = 6;

// split on runs of whitespace; a blank line yields no fields at all
inline std::vector<std::string> &split_fields(std::string const &line, std::vector<std::string> &fields)
{
    fields.clear();
    std::string const trimmed = boost::algorithm::trim_copy(line);
    if (!trimmed.empty())
    {
        boost::algorithm::split(
            fields,
            trimmed,
            boost::algorithm::is_space(),
            boost::algorithm::token_compress_on);
    }
    return fields;
}

}   // namespace detail

inline record parse_record(std::string const &line)
{
    std::vector<std::string> fields;
    detail::split_fields(line, fields);
    if (fields.size() < detail::record_fields)
        BOOST_THROW_EXCEPTION(malformed_record_error(line, fields.size()));

    record result;
    result.patient_id = fields[0];
    result.name       = fields[1] + " " + fields[2];
    result.age        = fields[3];
    result.diagnosis  = fields[4];
    result.treatment  = fields[5];
    return result;
}

}   // namespace medreduce

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.
