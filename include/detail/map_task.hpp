// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

namespace medreduce {

// Tallies one input partition into diagnosis and treatment count tables and
// leaves them on local disk for the reduce phase. Each task only writes the
// files named from its own partition and index.
class map_task
{
  public:
    struct summary
    {
        size_t records;         // records tallied
        size_t diagnoses;       // distinct diagnoses seen
        size_t treatments;      // distinct treatments seen
        size_t files_written;   // intermediate files left for the reduce phase

        summary() : records(0), diagnoses(0), treatments(0), files_written(0)
        {
        }
    };

    summary operator()(specification const &spec, size_t const task) const
    {
        count_table diagnosis_counts;
        count_table treatment_counts;

        summary result;
        datasource::line_reader reader(spec.partitions.at(task));
        std::string line;
        while (reader.next(line))
        {
            record rec;
            try
            {
                rec = parse_record(line);
            }
            catch (malformed_record_error &e)
            {
                BOOST_THROW_EXCEPTION(
                    malformed_record_error(
                        e.line(), e.tokens(), reader.filename(), reader.line_number()));
            }

            ++diagnosis_counts[rec.diagnosis];
            ++treatment_counts[rec.treatment];
            ++result.records;
        }

        intermediates::local_disk const store(spec);
        store.write(task, intermediates::diagnosis_category, diagnosis_counts);
        store.write(task, intermediates::treatment_category, treatment_counts);

        result.diagnoses     = diagnosis_counts.size();
        result.treatments    = treatment_counts.size();
        result.files_written = 2;
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
