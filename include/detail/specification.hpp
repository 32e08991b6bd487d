// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <limits>
#include <boost/lexical_cast.hpp>

namespace medreduce {

namespace detail {

inline bool const same_file(boost::filesystem::path const &first, boost::filesystem::path const &second)
{
    boost::system::error_code ec;
    return boost::filesystem::equivalent(first, second, ec)  &&  !ec;
}

}   // namespace detail

// Fill the partition list from the input directory. The only files left out
// are the report itself and intermediates sitting in the intermediate
// directory; an input that merely shares a name with either is counted.
inline void discover_partitions(specification &spec)
{
    boost::filesystem::path const report(spec.output_filespec);
    boost::filesystem::path const intermediate_directory(spec.intermediate_directory);
    spec.partitions =
        datasource::list_partitions(
            spec.input_directory,
            spec.input_extension,
            [&report, &intermediate_directory](boost::filesystem::path const &path) -> bool {
                if (detail::same_file(path, report))
                    return true;
                return intermediates::is_intermediate_filename(path.filename().string())
                    && detail::same_file(path.parent_path(), intermediate_directory);
            });
    spec.map_tasks = spec.partitions.size();
}

inline specification make_specification(std::string const &input_directory)
{
    specification spec;
    spec.input_directory = input_directory;
    discover_partitions(spec);
    return spec;
}

// a decimal port number in 0..65535; 0 lets the system choose
inline unsigned short const parse_port(std::string const &text)
{
    if (!text.empty()  &&  text.length() <= 5  &&  boost::algorithm::all(text, boost::algorithm::is_digit()))
    {
        unsigned long const port = boost::lexical_cast<unsigned long>(text);
        if (port <= std::numeric_limits<unsigned short>::max())
            return static_cast<unsigned short>(port);
    }
    BOOST_THROW_EXCEPTION(configuration_error("invalid port \"" + text + "\""));
}

inline void validate(specification const &spec)
{
    if (spec.map_tasks != spec.partitions.size())
    {
        BOOST_THROW_EXCEPTION(configuration_error(
            "map task count " + std::to_string(spec.map_tasks)
          + " does not match the " + std::to_string(spec.partitions.size()) + " input partitions"));
    }

    // every reduce task writes the whole report, there is no sharded output
    if (spec.reduce_tasks != 1)
    {
        BOOST_THROW_EXCEPTION(configuration_error(
            "only a single reduce task is supported, " + std::to_string(spec.reduce_tasks) + " requested"));
    }

    if (spec.output_filespec.empty())
        BOOST_THROW_EXCEPTION(configuration_error("no report filespec given"));
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
