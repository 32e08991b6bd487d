// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <limits>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

namespace medreduce {

namespace intermediates {

char const * const diagnosis_category = "diagnosis";
char const * const treatment_category = "treatment";

inline std::string const filename_prefix()
{
    return "map-";
}

inline bool const is_intermediate_filename(std::string const &leaf)
{
    return boost::algorithm::starts_with(leaf, filename_prefix());
}

// map-<category>-<partition file name>-<map task>.txt
inline std::string const intermediate_filename(std::string const &directory,
                                               std::string const &partition,
                                               size_t      const  map_task,
                                               std::string const &category)
{
    std::ostringstream filename;
    filename << filename_prefix()
             << category << "-"
             << boost::filesystem::path(partition).filename().string() << "-"
             << map_task << ".txt";
    return (boost::filesystem::path(directory) / filename.str()).string();
}

// adds count to counts[value], refusing a total that would wrap
inline bool const accumulate(count_table &counts, std::string const &value, std::uintmax_t const count)
{
    std::uintmax_t &total = counts[value];
    if (count > std::numeric_limits<std::uintmax_t>::max() - total)
        return false;
    total += count;
    return true;
}

// one "<value> <count>" line per entry, in the table's order
inline void write_counts(std::string const &filename, count_table const &counts)
{
#ifdef DEBUG_TRACE_OUTPUT
    std::clog << "\nwriting " << counts.size() << " counts to " << filename;
#endif
    detail::committed_file file(filename);
    for (auto const &count : counts)
        file.stream() << count.first << " " << count.second << "\n";
    file.commit();
}

// adds every "<value> <count>" line of the file into counts, returning the
// number of lines read
inline size_t const read_counts(std::string const &filename, count_table &counts)
{
#ifdef DEBUG_TRACE_OUTPUT
    std::clog << "\nreading counts from " << filename;
#endif
    datasource::line_reader reader(filename);

    size_t records = 0;
    std::string line;
    std::vector<std::string> fields;
    while (reader.next(line))
    {
        detail::split_fields(line, fields);

        std::uintmax_t count = 0;
        bool valid = fields.size() == 2  &&  boost::algorithm::all(fields[1], boost::algorithm::is_digit());
        if (valid)
        {
            try
            {
                count = boost::lexical_cast<std::uintmax_t>(fields[1]);
            }
            catch (boost::bad_lexical_cast &)
            {
                valid = false;
            }
        }

        if (!valid)
        {
            std::ostringstream err;
            err << "malformed count at line " << reader.line_number() << " \"" << line << "\"";
            BOOST_THROW_EXCEPTION(io_error(filename, err.str()));
        }

        if (!accumulate(counts, fields[0], count))
        {
            std::ostringstream err;
            err << "count overflow at line " << reader.line_number() << " \"" << line << "\"";
            BOOST_THROW_EXCEPTION(io_error(filename, err.str()));
        }
        ++records;
    }
    return records;
}

// the intermediate files of one run, named from its specification
class local_disk : detail::noncopyable
{
  public:
    explicit local_disk(specification const &spec)
      : specification_(spec)
    {
    }

    std::string const filename(size_t const map_task, std::string const &category) const
    {
        return intermediate_filename(
            specification_.intermediate_directory,
            specification_.partitions.at(map_task),
            map_task,
            category);
    }

    void write(size_t const map_task, std::string const &category, count_table const &counts) const
    {
        write_counts(filename(map_task, category), counts);
    }

    size_t const read(size_t const map_task, std::string const &category, count_table &counts) const
    {
        return read_counts(filename(map_task, category), counts);
    }

  private:
    specification const &specification_;
};

}   // namespace intermediates

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
