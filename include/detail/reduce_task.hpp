// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

namespace medreduce {

char const * const diagnosis_heading = "Diagnosis Counts:";
char const * const treatment_heading = "Treatment Counts:";

struct report
{
    count_table diagnoses;
    count_table treatments;
};

inline void write_report(std::string const &filename, report const &totals)
{
    detail::committed_file file(filename);
    std::ostream &out = file.stream();

    out << diagnosis_heading << "\n";
    for (auto const &count : totals.diagnoses)
        out << count.first << " " << count.second << "\n";

    out << treatment_heading << "\n";
    for (auto const &count : totals.treatments)
        out << count.first << " " << count.second << "\n";

    file.commit();
}

inline report read_report(std::string const &filename)
{
    datasource::line_reader reader(filename);

    report result;
    count_table *section = 0;
    std::string line;
    std::vector<std::string> fields;
    while (reader.next(line))
    {
        if (line == diagnosis_heading)
            section = &result.diagnoses;
        else if (line == treatment_heading)
            section = &result.treatments;
        else if (!detail::split_fields(line, fields).empty())
        {
            if (section == 0  ||  fields.size() != 2  ||  !boost::algorithm::all(fields[1], boost::algorithm::is_digit()))
                BOOST_THROW_EXCEPTION(io_error(filename, "unexpected report line " + std::to_string(reader.line_number())));

            std::uintmax_t count = 0;
            try
            {
                count = boost::lexical_cast<std::uintmax_t>(fields[1]);
            }
            catch (boost::bad_lexical_cast &)
            {
                BOOST_THROW_EXCEPTION(io_error(filename, "bad count at report line " + std::to_string(reader.line_number())));
            }

            if (!intermediates::accumulate(*section, fields[0], count))
                BOOST_THROW_EXCEPTION(io_error(filename, "count overflow at report line " + std::to_string(reader.line_number())));
        }
    }
    return result;
}

// Merges the count tables of every map task of the run into the final
// report. A single missing or unreadable table fails the task; there is no
// partial aggregate and no report is written.
class reduce_task
{
  public:
    struct summary
    {
        size_t files_read;
        size_t diagnoses;
        size_t treatments;

        summary() : files_read(0), diagnoses(0), treatments(0)
        {
        }
    };

    summary operator()(specification const &spec, size_t const /*task*/) const
    {
        intermediates::local_disk const store(spec);

        summary result;
        report totals;
        for (size_t partition=0; partition<spec.map_tasks; ++partition)
        {
            store.read(partition, intermediates::diagnosis_category, totals.diagnoses);
            store.read(partition, intermediates::treatment_category, totals.treatments);
            result.files_read += 2;
        }

        write_report(spec.output_filespec, totals);

        result.diagnoses  = totals.diagnoses.size();
        result.treatments = totals.treatments.size();
        return result;
    }
};

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
