#pragma once

#include "ContentHasher/ContentHasher.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace fs = std::filesystem;

class TimestampProvider;
class RandomSource;

/**
 * @brief Sub-commands of the hashid executable.
 */
enum class ToolCommand
{
    New,    /**< Identify text or file content */
    Random, /**< Identify fresh random bytes */
    Decode  /**< Print the fields of an existing identifier */
};

/**
 * @brief Convert a ToolCommand value to its command-line name.
 *
 * @param[in] command The command to convert
 * @return Name of the command
 */
inline const char* ToolCommandToString(ToolCommand command)
{
    switch (command)
    {
    case ToolCommand::New:
        return "new";
    case ToolCommand::Random:
        return "random";
    case ToolCommand::Decode:
        return "decode";
    }
    return "unknown";
}

/**
 * @brief Convert a command-line name to a ToolCommand value.
 *
 * @param[in] stringValue Name to convert
 * @param[out] command Matching command, untouched when not recognized
 * @return false if the name is not recognized
 */
inline bool StringToToolCommand(const std::string& stringValue, ToolCommand& command)
{
    if ("new" == stringValue)
    {
        command = ToolCommand::New;
        return true;
    }
    if ("random" == stringValue)
    {
        command = ToolCommand::Random;
        return true;
    }
    if ("decode" == stringValue)
    {
        command = ToolCommand::Decode;
        return true;
    }
    return false;
}

/**
 * @brief Configuration parameters for one tool invocation.
 */
struct ToolConfig
{
    ToolCommand command;                       /**< Sub-command to run */
    std::optional<std::string> text;           /**< Content given inline (new) */
    std::optional<fs::path> file;              /**< Content read from a file (new) */
    std::string identifier;                    /**< Hex identifier (decode) */
    DigestAlgorithm algorithm;                 /**< Digest used for new and random */
    std::size_t randomWidth;                   /**< Random bytes to hash, 32 or 64 (random) */
    bool verbose;                              /**< Print decoded fields after creating an identifier */

    const TimestampProvider* timestampProvider; /**< Clock override, system clock when null */
    const RandomSource* randomSource;           /**< Random source override, OpenSSL when null */

    /**
     * @brief Initialize configuration with default values.
     */
    ToolConfig()
        : command(ToolCommand::New)
        , algorithm(DigestAlgorithm::Blake3)
        , randomWidth(32)
        , verbose(false)
        , timestampProvider(nullptr)
        , randomSource(nullptr)
    {
    }
};

/**
 * @brief Execute one tool command.
 *
 * Results go to output, diagnostics to errorOutput.
 *
 * @param[in] config Parameters of the invocation
 * @param[out] output Stream receiving results
 * @param[out] errorOutput Stream receiving error messages
 * @return Process exit code, 0 on success and 1 on failure
 */
int RunTool(const ToolConfig& config, std::ostream& output, std::ostream& errorOutput);
