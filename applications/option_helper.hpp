#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <args.hxx>

#include <hetfeat/constants.hpp>

class OptionHelper
{
protected:
    //The order of class member variable initiation
    //depends on the order of member variable declaration in the class
    //so parser should be placed before any other args' flags
    args::ArgumentParser parser;
private:
    args::HelpFlag help;
    args::ValueFlag<int> thread_num_flag;
public:
    int thread_num;
    OptionHelper(std::string const& description) :
        parser(description, ""),
        help(parser, "help", "Display this help menu", {'h', "help"}),
        thread_num_flag(parser, "threads", "[optional] number of OpenMP threads per process, all cores by default", {'t', "threads"})
    {}

    virtual ~OptionHelper() {}

    virtual void parse(int argc, char **argv)
    {
        try
        {
            parser.ParseCLI(argc, argv);
        }
        catch (args::Help const&)
        {
            std::cout << parser;
            exit(0);
        }
        catch (args::ParseError const& e)
        {
            fail(e.what());
        }
        catch (args::ValidationError const& e)
        {
            fail(e.what());
        }

        thread_num = thread_num_flag ? args::get(thread_num_flag) : 0;
    }

protected:
    void fail(std::string const& message)
    {
        std::cerr << message << std::endl;
        std::cerr << parser;
        exit(1);
    }

    template <typename T> T get_required(args::ValueFlag<T>& flag, std::string const& name)
    {
        if (!flag)
        {
            fail("missing required option --" + name);
        }
        return args::get(flag);
    }
};

class EdgeTableOptionHelper : public OptionHelper
{
private:
    args::ValueFlag<std::string> edges_path_flag;
    args::ValueFlag<std::string> output_prefix_flag;
public:
    std::string edges_path;
    std::string output_prefix;
    EdgeTableOptionHelper(std::string const& description) :
        OptionHelper(description),
        edges_path_flag(parser, "edges", "edge table (csv with :START_ID, :END_ID, :TYPE)", {"edges"}),
        output_prefix_flag(parser, "output", "prefix of the output files", {'o', "output"})
    {}

    virtual void parse(int argc, char **argv)
    {
        OptionHelper::parse(argc, argv);

        edges_path = get_required(edges_path_flag, "edges");
        output_prefix = get_required(output_prefix_flag, "output");
    }
};

class ExtractOptionHelper : public EdgeTableOptionHelper
{
private:
    args::ValueFlag<std::string> nodes_path_flag;
    args::ValueFlag<std::string> start_kind_flag;
    args::ValueFlag<std::string> end_kind_flag;
    args::ValueFlag<uint32_t> max_length_flag;
    args::ValueFlag<double> damping_flag;
    args::ValueFlag<std::string> catalog_path_flag;
    args::ValueFlag<std::string> write_catalog_flag;
    args::ValueFlagList<std::string> features_flag;
    args::Flag fail_fast_flag;
    args::Flag verbose_flag;
public:
    std::string nodes_path;
    std::string start_kind;
    std::string end_kind;
    uint32_t max_length;
    double damping;
    std::string catalog_path;
    std::string write_catalog_path;
    std::vector<std::string> features;
    bool fail_fast;
    bool verbose;
    ExtractOptionHelper() :
        EdgeTableOptionHelper("Degree-weighted path and walk counts between two node kinds of a heterogeneous network."),
        nodes_path_flag(parser, "nodes", "node table (csv with :ID, :LABEL)", {"nodes"}),
        start_kind_flag(parser, "start", "start node kind", {"start"}),
        end_kind_flag(parser, "end", "end node kind", {"end"}),
        max_length_flag(parser, "length", "[optional] maximum metapath length", {'l', "max-length"}),
        damping_flag(parser, "w", "[optional] degree dampening exponent in [0, 1]", {'w', "damping"}),
        catalog_path_flag(parser, "catalog", "[optional] metapath catalog used instead of enumeration", {"catalog"}),
        write_catalog_flag(parser, "write-catalog", "[optional] write the metapaths in use to this path", {"write-catalog"}),
        features_flag(parser, "features", "[optional, repeatable] dwpc | dwwc | degrees, dwpc by default", {"features"}),
        fail_fast_flag(parser, "fail-fast", "stop starting metapaths after the first failure", {"fail-fast"}),
        verbose_flag(parser, "verbose", "print progress and timings", {"verbose"})
    {}

    virtual void parse(int argc, char **argv)
    {
        EdgeTableOptionHelper::parse(argc, argv);

        nodes_path = get_required(nodes_path_flag, "nodes");
        start_kind = get_required(start_kind_flag, "start");
        end_kind = get_required(end_kind_flag, "end");
        max_length = max_length_flag ? args::get(max_length_flag) : hetfeat::default_max_length;
        damping = damping_flag ? args::get(damping_flag) : hetfeat::default_damping;
        if (catalog_path_flag)
        {
            catalog_path = args::get(catalog_path_flag);
        }
        if (write_catalog_flag)
        {
            write_catalog_path = args::get(write_catalog_flag);
        }

        features = args::get(features_flag);
        if (features.empty())
        {
            features.push_back("dwpc");
        }
        for (std::string const& feature : features)
        {
            if (feature != "dwpc" && feature != "dwwc" && feature != "degrees")
            {
                fail("unknown feature '" + feature + "'");
            }
        }

        fail_fast = fail_fast_flag;
        verbose = verbose_flag;
    }
};

class PermuteOptionHelper : public EdgeTableOptionHelper
{
private:
    args::ValueFlag<std::string> excluded_path_flag;
    args::ValueFlag<double> multiplier_flag;
    args::ValueFlag<uint32_t> seed_flag;
public:
    std::string excluded_path;
    double multiplier;
    uint32_t seed;
    PermuteOptionHelper() :
        EdgeTableOptionHelper("Degree preserving edge permutation of every edge type of a network."),
        excluded_path_flag(parser, "excluded", "[optional] edge table of pairs the permutation must not create", {"excluded"}),
        multiplier_flag(parser, "multiplier", "[optional] swap attempts per edge", {'m', "multiplier"}),
        seed_flag(parser, "seed", "[optional] random seed", {'s', "seed"})
    {}

    virtual void parse(int argc, char **argv)
    {
        EdgeTableOptionHelper::parse(argc, argv);

        if (excluded_path_flag)
        {
            excluded_path = args::get(excluded_path_flag);
        }
        multiplier = multiplier_flag ? args::get(multiplier_flag) : hetfeat::default_permutation_multiplier;
        seed = seed_flag ? args::get(seed_flag) : 0;
    }
};
