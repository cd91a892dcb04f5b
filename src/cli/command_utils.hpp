#pragma once
#include <string>
#include <string_view>
#include <vector>

#include <casket/log/log_manager.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>

#include <mqcert/pki/artifact_writer.hpp>
#include <mqcert/pki/types.hpp>

namespace mqcert::cmd
{

/// Options shared by every issuing command.
struct OutputOptions
{
    std::string outDir;
    std::string logLevel;
    bool overwrite{false};
};

casket::Level ParseLogLevel(std::string_view str);

/// @brief Parses and validates @p args; option errors are reported as ValidationError.
///
/// @return false when help was requested and printed.
bool ParseArgs(casket::opt::CmdLineOptionsParser& parser, const std::vector<std::string_view>& args,
               std::string_view usage);

/// @brief Adds the subject options (--cn, --org, --ou, --country, --state, --locality, --email, --serial),
/// marking as required the ones the role cannot do without. The ca role requires none.
void AddIdentityOptions(casket::opt::CmdLineOptionsParser& parser, pki::IdentityFields& fields, pki::Role role);

/// @brief Adds --out, --overwrite and --log-level to @p parser.
void AddOutputOptions(casket::opt::CmdLineOptionsParser& parser, OutputOptions& options);

/// @brief Enables console logging at the requested level and reads --overwrite.
void ApplyOutputOptions(casket::opt::CmdLineOptionsParser& parser, OutputOptions& options);

/// @brief Reads a PEM file, "-" is standard input.
///
/// @throws ResourceError if the file cannot be read.
std::string ReadPemFile(const std::string& path);

/// @brief Writes the artifacts to --out, or prints them to standard output when no directory is given.
/// The details text goes to standard output in both cases.
void EmitArtifacts(const OutputOptions& options, const std::vector<pki::Artifact>& artifacts,
                   const std::string& details);

} // namespace mqcert::cmd
