#include "HashIdTool/HashIdTool.hpp"
#include "HashId/HashId.hpp"
#include "TimestampProvider/TimestampProvider.hpp"

#ifdef HASHID_ENABLE_RANDOM_ID
#include "RandomSource/RandomHashIdGenerator.hpp"
#include "RandomSource/RandomSource.hpp"
#endif

#include "ContentHasher/HexEncoding.hpp"

#include <memory>

namespace
{

/**
 * @brief Print both fields of an identifier.
 *
 * @param[in] hashId Identifier to describe
 * @param[out] output Destination stream
 */
void PrintFields(const HashId& hashId, std::ostream& output)
{
    const Tai64NBytes timestampBytes = hashId.Timestamp().ToBytes();
    output << "timestamp: " << BytesToHex(timestampBytes.data(), timestampBytes.size()) << " (" << hashId.Timestamp().ToIso8601() << ")\n";
    output << "digest: " << hashId.ContentDigest().ToHex() << '\n';
}

int EmitCreated(const HashId& hashId, bool verbose, std::ostream& output)
{
    output << hashId.ToHex() << '\n';
    if (true == verbose)
    {
        PrintFields(hashId, output);
    }
    return 0;
}

int RunNew(const ToolConfig& config, const TimestampProvider& timestampProvider, std::ostream& output, std::ostream& errorOutput)
{
    if (config.text.has_value() == config.file.has_value())
    {
        errorOutput << "Exactly one of --text or --file is required\n";
        return 1;
    }

    const std::unique_ptr<ContentHasher> contentHasher = CreateContentHasher(config.algorithm);
    Digest digest;
    if (true == config.text.has_value())
    {
        const std::string& text = config.text.value();
        if (false == contentHasher->Compute(reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), digest))
        {
            errorOutput << "Failed to hash text with " << DigestAlgorithmToString(config.algorithm) << '\n';
            return 1;
        }
    }
    else if (false == contentHasher->ComputeFile(config.file.value(), digest))
    {
        errorOutput << "Failed to hash file " << config.file.value().string() << '\n';
        return 1;
    }

    return EmitCreated(HashId::Create(digest, timestampProvider), config.verbose, output);
}

int RunRandom(const ToolConfig& config, const TimestampProvider& timestampProvider, std::ostream& output, std::ostream& errorOutput)
{
#ifdef HASHID_ENABLE_RANDOM_ID
    RandomWidth width = RandomWidth::Bytes32;
    if (64 == config.randomWidth)
    {
        width = RandomWidth::Bytes64;
    }
    else if (32 != config.randomWidth)
    {
        errorOutput << "Random width must be 32 or 64, got " << config.randomWidth << '\n';
        return 1;
    }

    OpenSslRandomSource systemRandomSource;
    const RandomSource& randomSource = (nullptr != config.randomSource) ? *config.randomSource : systemRandomSource;
    const std::unique_ptr<ContentHasher> contentHasher = CreateContentHasher(config.algorithm);

    const RandomHashIdGenerator generator(timestampProvider, *contentHasher, randomSource);
    const std::optional<HashId> hashId = generator.Generate(width);
    if (false == hashId.has_value())
    {
        errorOutput << "Failed to generate random identifier\n";
        return 1;
    }

    return EmitCreated(hashId.value(), config.verbose, output);
#else
    (void)config;
    (void)timestampProvider;
    (void)output;
    errorOutput << "Random identifiers are not available in this build\n";
    return 1;
#endif
}

int RunDecode(const ToolConfig& config, std::ostream& output, std::ostream& errorOutput)
{
    HashId hashId;
    const HashIdStatus status = HashId::FromHex(config.identifier, hashId);
    if (HashIdStatus::Ok != status)
    {
        errorOutput << "Invalid identifier: " << HashIdStatusToString(status) << '\n';
        return 1;
    }

    PrintFields(hashId, output);
    return 0;
}

} // namespace

int RunTool(const ToolConfig& config, std::ostream& output, std::ostream& errorOutput)
{
    SystemTimestampProvider systemTimestampProvider;
    const TimestampProvider& timestampProvider = (nullptr != config.timestampProvider) ? *config.timestampProvider : systemTimestampProvider;

    switch (config.command)
    {
    case ToolCommand::New:
        return RunNew(config, timestampProvider, output, errorOutput);
    case ToolCommand::Random:
        return RunRandom(config, timestampProvider, output, errorOutput);
    case ToolCommand::Decode:
        return RunDecode(config, output, errorOutput);
    }

    errorOutput << "Unknown command\n";
    return 1;
}
