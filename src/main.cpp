#include "image.hpp"
#include "reader.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <argparse.hpp>

namespace {

std::ifstream open_input(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    return file;
}

// Runs `fn` on either the named file or standard input.
template <typename Fn>
void with_input(const std::string& filename, Fn&& fn) {
    if (filename.empty() || filename == "-") {
        fn(std::cin);
        return;
    }
    std::ifstream file = open_input(filename);
    fn(file);
}

} // namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("hexbin", "0.1.0", argparse::default_arguments::all);
    program.add_description("Convert Intel HEX text into a raw binary image.");

    program.add_argument("-i", "--input")
        .help("Intel HEX file to read (default: standard input)")
        .default_value(std::string(""));

    program.add_argument("-o", "--output")
        .help("Binary file to write (default: standard output)")
        .default_value(std::string(""));

    program.add_argument("-v", "--verbose")
        .help("Report the assembled image size on stderr")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser explain_command("explain");
    explain_command.add_description("Print one human-readable line per record instead of assembling.");
    explain_command.add_argument("-i", "--input")
        .help("Intel HEX file to read (default: standard input)")
        .default_value(std::string(""));

    program.add_subparser(explain_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    try {
        if (program.is_subcommand_used("explain")) {
            with_input(explain_command.get<std::string>("--input"), [](std::istream& in) {
                hexbin::HexReader reader(in);
                hexbin::explain(reader, std::cout);
            });
            return 0;
        }

        std::string output = program.get<std::string>("--output");
        bool verbose = program.get<bool>("--verbose");

        // Nothing touches the output until the whole image has assembled.
        std::vector<uint8_t> image;
        size_t records = 0;
        with_input(program.get<std::string>("--input"), [&](std::istream& in) {
            hexbin::HexReader reader(in);
            hexbin::ImageAssembler assembler;
            image = assembler.run(reader);
            records = assembler.records_seen();
        });

        if (output.empty() || output == "-") {
            hexbin::dump(image, std::cout);
        } else {
            std::ofstream outfile(output, std::ios::binary);
            if (!outfile.is_open()) {
                throw std::runtime_error("Could not open file: " + output);
            }
            hexbin::dump(image, outfile);
        }

        if (verbose) {
            std::cerr << "Assembled " << image.size() << " bytes from " << records << " records\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
