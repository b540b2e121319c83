/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>

#include "options.hpp"
#include "log.hpp"
#include "load_tree.hpp"
#include "counter_store.hpp"
#include "source_buffer.hpp"
#include "flow_counts.hpp"
#include "branch_report.hpp"
#include "coverage.hpp"

Options options;

int main(int argc, char **argv)
{
    try
    {
        namespace po = boost::program_options;
        po::options_description program_options("Allowed options");
        program_options.add_options()
            ("help,h", "produce help message")
            ("version,v", "print version string")
            ("quiet,q", "be quiet")
            ("verbose,V", "be verbose")
            ("extra-verbose,VV", "be even more verbose")
            ("exit-success", "exit with 0, even if errors occured")
            ("tree", po::value(&options.tree_file)->value_name("FILENAME")->required(), "decorated syntax tree of the unit")
            ("counters", po::value(&options.counters_file)->value_name("FILENAME"), "tracker hit counts, one 'id count' pair per line")
            ("source", po::value(&options.source_file)->value_name("FILENAME"), "source text of the unit")
            ("runs", "print raw and demoted run counts of every branching construct")
            ;
        po::variables_map variables;
        store(po::command_line_parser(argc, argv)
              .options(program_options)
              .run(), variables);
        if (variables.count("help"))
        {
            std::cout << program_options << std::endl;
            return 0;
        }
        if (variables.count("version"))
        {
            std::cout << "branchcov 0.1" << std::endl;
            return 0;
        }
        if (variables.count("quiet"))
        {
            Log::set_level(Log::Warning);
        }
        if (variables.count("verbose"))
        {
            Log::set_level(Log::Debug);
        }
        if (variables.count("extra-verbose"))
        {
            Log::set_level(Log::Trace);
        }
        options.exit_success = variables.count("exit-success") > 0;
        options.runs = variables.count("runs") > 0;
        notify(variables);

        Log::set_unit(options.tree_file);

        branchcov::syntax_tree tree = branchcov::load_tree_file(options.tree_file);
        branchcov::counter_store counters;
        if (!options.counters_file.empty())
        {
            counters = branchcov::read_counters_file(options.counters_file);
        }
        branchcov::source_buffer source;
        if (!options.source_file.empty())
        {
            source = branchcov::read_source_file(options.source_file);
        }

        branchcov::flow_counts counts(tree, counters);
        std::cout << branchcov::build_branch_report(tree, counts, source) << std::endl;

        if (options.runs)
        {
            branchcov::run_counts raw = branchcov::raw_runs(counts);
            branchcov::run_counts demoted = branchcov::demote_partially_covered(counts, raw);
            branchcov::print_runs(std::cout, tree, raw, demoted);
            branchcov::report_partial_coverage(
                std::cout, tree, raw, demoted,
                options.source_file.empty() ? options.tree_file : options.source_file);
        }
    }
    catch (std::exception const& error)
    {
        Log::error() << error.what() << "\n\n";
        return options.exit_success ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    int result = Log::result();
    return options.exit_success ? EXIT_SUCCESS : result;
}
