#include "HashIdTool/HashIdTool.hpp"
#include "cxxopts.hpp"

#include <exception>
#include <iostream>
#include <optional>

namespace
{

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional (e.g., if help is shown or the command is missing).
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("hashid", "Sortable timestamp + digest identifiers");

    // clang-format off
    options.add_options()
        ("command",   "new | random | decode", cxxopts::value<std::string>())
        ("t,text",    "Content to identify (new)", cxxopts::value<std::string>())
        ("f,file",    "File whose content to identify (new)", cxxopts::value<std::string>())
        ("i,id",      "Identifier to decode, 88 hex characters (decode)", cxxopts::value<std::string>())
        ("a,algorithm", "Digest algorithm: blake3, blake2s256, sha256, sha3-256", cxxopts::value<std::string>()->default_value("blake3"))
        ("w,width",   "Random bytes to hash: 32 or 64 (random)", cxxopts::value<std::size_t>()->default_value("32"))
        ("v,verbose", "Print decoded fields of created identifiers")
        ("h,help",    "Print help");
    // clang-format on

    options.parse_positional({"command"});
    options.positional_help("<command>");

    auto parseResult = options.parse(argc, argv);

    if ((true == parseResult.count("help")) || (false == parseResult.count("command")))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

/**
 * @brief Sets up the ToolConfig based on parsed command-line options.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return std::optional<ToolConfig> if every option is valid, otherwise an empty optional.
 */
std::optional<ToolConfig> SetupToolConfiguration(const cxxopts::ParseResult& parseResult)
{
    ToolConfig config;

    const std::string commandName = parseResult["command"].as<std::string>();
    if (false == StringToToolCommand(commandName, config.command))
    {
        std::cerr << "Unknown command: " << commandName << '\n';
        return std::nullopt;
    }

    const std::string algorithmName = parseResult["algorithm"].as<std::string>();
    if (false == StringToDigestAlgorithm(algorithmName, config.algorithm))
    {
        std::cerr << "Unknown digest algorithm: " << algorithmName << '\n';
        return std::nullopt;
    }

    if (0 < parseResult.count("text"))
    {
        config.text = parseResult["text"].as<std::string>();
    }
    if (0 < parseResult.count("file"))
    {
        config.file = fs::path(parseResult["file"].as<std::string>());
    }
    if (0 < parseResult.count("id"))
    {
        config.identifier = parseResult["id"].as<std::string>();
    }

    config.randomWidth = parseResult["width"].as<std::size_t>();
    config.verbose = (0 < parseResult.count("verbose"));

    return config;
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<cxxopts::ParseResult> parseResult;
    try
    {
        parseResult = ParseCommandLineOptions(argc, argv);
    }
    catch (const std::exception& exception)
    {
        std::cerr << exception.what() << '\n';
        return 1;
    }

    if (false == parseResult.has_value())
    {
        return 0; // Help was shown, exit gracefully.
    }

    std::optional<ToolConfig> toolConfiguration;
    try
    {
        toolConfiguration = SetupToolConfiguration(parseResult.value());
    }
    catch (const std::exception& exception)
    {
        std::cerr << exception.what() << '\n';
        return 1;
    }

    if (false == toolConfiguration.has_value())
    {
        return 1; // Configuration failed, error message already printed.
    }

    return RunTool(toolConfiguration.value(), std::cout, std::cerr);
}
