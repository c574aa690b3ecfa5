#include "append.settings.hh"
#include "blosc.compression.params.hh"
#include "macros.hh"
#include "pipeline.hh"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {
Cf2ZarrLogLevel
parse_log_level(const std::string& text)
{
    if (text == "debug") {
        return Cf2ZarrLogLevel_Debug;
    } else if (text == "info") {
        return Cf2ZarrLogLevel_Info;
    } else if (text == "warning") {
        return Cf2ZarrLogLevel_Warning;
    } else if (text == "error") {
        return Cf2ZarrLogLevel_Error;
    } else if (text == "none") {
        return Cf2ZarrLogLevel_None;
    }

    const std::string err = LOG_ERROR("Invalid log level '", text, "'");
    throw cf2zarr::InvalidSettingsError(err);
}

std::string
env_or(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    return value && *value ? std::string(value) : fallback;
}

/// Overlay command line options onto @p settings.
void
apply_options(const po::variables_map& vm, cf2zarr::AppendSettings& settings)
{
    if (vm.count("input")) {
        settings.input = vm["input"].as<std::string>();
    }
    if (vm.count("zarr")) {
        settings.existing = vm["zarr"].as<std::string>();
    }
    if (vm.count("output")) {
        settings.output = vm["output"].as<std::string>();
    }
    if (vm.count("pattern")) {
        settings.pattern = vm["pattern"].as<std::string>();
    }
    if (vm.count("time-dim")) {
        settings.ordering_dimension = vm["time-dim"].as<std::string>();
    }
    if (vm.count("variables")) {
        settings.variables = vm["variables"].as<std::vector<std::string>>();
    }
    if (vm.count("duration")) {
        settings.max_duration = vm["duration"].as<std::string>();
    }
    if (vm.count("chunks")) {
        settings.chunk_shape =
          cf2zarr::parse_chunk_shape(vm["chunks"].as<std::string>());
    }
    if (vm.count("codec")) {
        settings.compression.codec_id = vm["codec"].as<std::string>();
    }
    if (vm.count("clevel")) {
        settings.compression.clevel =
          static_cast<uint8_t>(vm["clevel"].as<unsigned int>());
    }
    if (vm.count("shuffle")) {
        settings.compression.shuffle =
          static_cast<uint8_t>(vm["shuffle"].as<unsigned int>());
    }
    if (vm["overwrite"].as<bool>()) {
        settings.create_mode = Cf2ZarrCreateMode_Overwrite;
    }
    if (vm.count("threads")) {
        settings.thread_count = vm["threads"].as<unsigned int>();
    }

    // credentials come from the environment, as with the AWS tools
    if (settings.needs_s3()) {
        cf2zarr::S3Settings s3 = settings.s3.value_or(cf2zarr::S3Settings{});
        s3.endpoint = vm.count("s3-endpoint")
                        ? vm["s3-endpoint"].as<std::string>()
                        : env_or("AWS_ENDPOINT_URL", s3.endpoint);
        s3.access_key_id = env_or("AWS_ACCESS_KEY_ID", s3.access_key_id);
        s3.secret_access_key =
          env_or("AWS_SECRET_ACCESS_KEY", s3.secret_access_key);
        settings.s3 = s3;
    }
}
} // namespace

int
main(int argc, char* argv[])
{
    po::options_description desc(
      "cf2zarr-append - append time-series stores to a Zarr store\n\nUsage");
    desc.add_options()
        ("help,h", "Show this help message")
        ("input,i", po::value<std::string>(),
            "S3 URL prefix or local directory of input stores")
        ("zarr,z", po::value<std::string>(),
            "Existing store to append to (S3 URL or local path; empty or "
            "'none' for none)")
        ("zarr-access", po::value<std::string>()->default_value("stage"),
            "How to open the existing store: stage or mount")
        ("time-dim,t", po::value<std::string>(),
            "Name of the time dimension (default: time)")
        ("pattern,p", po::value<std::string>(),
            "Glob pattern of input stores (default: *.zarr)")
        ("duration,d", po::value<std::string>(),
            "Maximum span of the output along the time dimension, as an ISO "
            "8601 duration (P30D) or a pandas-style one (30 days)")
        ("output,o", po::value<std::string>(), "Output store path")
        ("variables", po::value<std::vector<std::string>>()->multitoken(),
            "Variables to convert (default: those of the existing store, or "
            "the first input variable)")
        ("chunks", po::value<std::string>(),
            "Chunk sizes, time dimension first (default: 5,50,50)")
        ("codec", po::value<std::string>(),
            "Blosc codec: blosclz, lz4, lz4hc, zlib or zstd (default: blosclz)")
        ("clevel", po::value<unsigned int>(), "Compression level 0-9 (default: 9)")
        ("shuffle", po::value<unsigned int>(),
            "0: none, 1: byte shuffle, 2: bit shuffle (default: 1)")
        ("overwrite", po::bool_switch()->default_value(false),
            "Replace the output store if it exists")
        ("config", po::value<std::string>(),
            "JSON configuration file; command line options take precedence")
        ("log-level", po::value<std::string>()->default_value("info"),
            "debug, info, warning, error or none")
        ("threads", po::value<unsigned int>(),
            "Writer threads (default: one per hardware thread)")
        ("s3-endpoint", po::value<std::string>(),
            "S3 endpoint URL (default: $AWS_ENDPOINT_URL)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << desc << "\n";
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return Cf2ZarrStatusCode_InvalidArgument;
    }

    try {
        Logger::set_log_level(parse_log_level(vm["log-level"].as<std::string>()));

        const auto access = vm["zarr-access"].as<std::string>();
        if (access == "mount") {
            const std::string err =
              LOG_ERROR("Mounting the existing store is not implemented");
            throw cf2zarr::NotYetImplementedError(err);
        }
        EXPECT_T(access == "stage",
                 cf2zarr::InvalidSettingsError,
                 "Unsupported zarr access method: ",
                 access);

        auto settings = vm.count("config")
                          ? cf2zarr::load_settings_file(
                              vm["config"].as<std::string>())
                          : cf2zarr::AppendSettings{};
        apply_options(vm, settings);

        const auto report = cf2zarr::append(settings);
        LOG_INFO("Wrote ",
                 report.n_entries,
                 " time steps to ",
                 settings.output,
                 " (",
                 report.dropped_duplicates.size(),
                 " duplicates dropped, ",
                 report.n_trimmed,
                 " trimmed)");
    } catch (const cf2zarr::Error& e) {
        LOG_ERROR("Failed: ", e.what());
        return e.status();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed: ", e.what());
        return Cf2ZarrStatusCode_InternalError;
    }

    return EXIT_SUCCESS;
}
