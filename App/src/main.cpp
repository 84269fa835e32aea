//
//  CLI front-end for the sifinder library
//

#include <argparse/argparse.hpp>

#include "arguments.hpp"
#include "hash_command.hpp"
#include "index_command.hpp"
#include "logger.hpp"
#include "manage_commands.hpp"
#include "search_command.hpp"

#include <array>
#include <functional>
#include <iostream>

using namespace sifinder_app;

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("sifinder", "1.0");
    program.add_description("Find visually similar images in indexed folders");
    program.add_epilog("Examples:\n  sifinder index -d ./photos\n  sifinder search -d ./photos -q query.jpg -t 6\n"
                       "  sifinder list\n\n"
                       "For detailed options: sifinder <command> --help");

    RawArguments args;

    argparse::ArgumentParser index_command("index");
    index_command.add_description("Create or refresh the index of a directory");

    argparse::ArgumentParser search_command("search");
    search_command.add_description("List indexed images visually similar to a query image");

    argparse::ArgumentParser hash_command("hash");
    hash_command.add_description("Print the perceptual fingerprints of images");

    argparse::ArgumentParser list_command("list");
    list_command.add_description("Show the indexes in the data directory");

    argparse::ArgumentParser delete_command("delete");
    delete_command.add_description("Delete an index (the images are left alone)");

    argparse::ArgumentParser prune_command("prune");
    prune_command.add_description("Remove index records of files that no longer exist");

    auto addLogLevel = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-l", "--log-level")
            .default_value(defaults::LOG_LEVEL)
            .scan<'i', int>()
            .store_into(args.logLevel)
            .help("Internal logging verbosity (4=warnings and errors, 3=info, 2=debug, 1=trace)");
    };

    // Options of every command that opens the data directory
    auto addCommonArgs = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("--data-dir")
            .default_value(std::string(defaults::DEFAULT_DATA_DIR))
            .store_into(args.dataDirectory)
            .help("Directory holding the index files (default: $SIFINDER_DATA_DIR or ~/.local/share/SI-Finder)");

        cmd.add_argument("-e", "--extensions")
            .default_value(std::string(defaults::DEFAULT_EXTENSIONS))
            .store_into(args.extensions)
            .help("Image file extensions to include (comma-separated)");

        cmd.add_argument("-b", "--batch-size")
            .default_value(defaults::BATCH_SIZE)
            .scan<'i', int>()
            .store_into(args.batchSize)
            .help("Number of records written per transaction");

        addLogLevel(cmd);
    };

    auto addTargetArgs = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-d", "--directory")
            .default_value(std::string(""))
            .store_into(args.directory)
            .help("Indexed directory");

        cmd.add_argument("-n", "--name")
            .default_value(std::string(""))
            .store_into(args.indexName)
            .help("Index name as shown by 'sifinder list'");
    };

    index_command.add_argument("-d", "--directory")
        .required()
        .store_into(args.directory)
        .help("Directory containing images to index");

    addTargetArgs(search_command);
    addTargetArgs(prune_command);

    search_command.add_argument("-q", "--query")
        .required()
        .store_into(args.query)
        .help("Image to look for");

    search_command.add_argument("-t", "--threshold")
        .default_value(defaults::THRESHOLD)
        .scan<'i', int>()
        .store_into(args.threshold)
        .help("Maximum Hamming distance of a match (0=near-identical, 20=loose)");

    search_command.add_argument("--limit")
        .default_value(defaults::LIMIT)
        .scan<'i', int>()
        .store_into(args.limit)
        .help("Show at most this many matches (0 = all)");

    search_command.add_argument("-o", "--output")
        .default_value(std::string(defaults::DEFAULT_OUTPUT))
        .store_into(args.outputPath)
        .help("Save matches to CSV file");

    hash_command.add_argument("images")
        .nargs(argparse::nargs_pattern::at_least_one)
        .store_into(args.images)
        .help("Image files to hash");

    hash_command.add_argument("-o", "--output")
        .default_value(std::string(defaults::DEFAULT_OUTPUT))
        .store_into(args.outputPath)
        .help("Save fingerprints to CSV file");

    delete_command.add_argument("name")
        .store_into(args.indexName)
        .help("Index name as shown by 'sifinder list'");

    delete_command.add_argument("-y", "--yes")
        .implicit_value(true)
        .default_value(defaults::ASSUME_YES)
        .store_into(args.assumeYes)
        .help("Do not ask for confirmation");

    addCommonArgs(index_command);
    addCommonArgs(search_command);
    addCommonArgs(list_command);
    addCommonArgs(delete_command);
    addCommonArgs(prune_command);
    addLogLevel(hash_command);

    program.add_subparser(index_command);
    program.add_subparser(search_command);
    program.add_subparser(hash_command);
    program.add_subparser(list_command);
    program.add_subparser(delete_command);
    program.add_subparser(prune_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    struct Subcommand {
        const char* name;
        Arguments::Command command;
        std::function<int(const Arguments&)> handler;
    };

    const std::array<Subcommand, 6> subcommands{ {
        { "index", Arguments::Command::Index, handleIndexCommand },
        { "search", Arguments::Command::Search, handleSearchCommand },
        { "hash", Arguments::Command::Hash, handleHashCommand },
        { "list", Arguments::Command::List, handleListCommand },
        { "delete", Arguments::Command::Delete, handleDeleteCommand },
        { "prune", Arguments::Command::Prune, handlePruneCommand },
    } };

    for (const auto& sub : subcommands) {
        if (!program.is_subcommand_used(sub.name)) continue;

        try {
            const Arguments validated(args, sub.command);

            logger::init(logger::levelFromVerbosity(validated.logLevel));
            const int status = sub.handler(validated);
            logger::shutdown();
            return status;
        }
        catch (const std::invalid_argument& err) {
            std::cerr << "Error: " << err.what() << '\n';
            return 1;
        }
    }

    std::cerr << "No command specified. Use 'index', 'search', 'hash', 'list', 'delete' or 'prune'\n";
    std::cerr << program;
    return 1;
}
