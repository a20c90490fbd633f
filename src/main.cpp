#include "instancing_pipeline.h"
#include "logging.h"
#include "core/tile_error.h"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    fprintf(stderr,
            "usage: %s <input.glb> <output> [--no-batch-table] [--keep-nodes] [--keep-extension] [--verbose]\n"
            "  writes i3dm (one instanced node), cmpt (several) or b3dm (none)\n",
            program);
}

bool read_file(const fs::path& path, std::vector<uint8_t>& data) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

bool write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

}

int main(int argc, char* argv[])
{
    if (argc < 3)
    {
        print_usage(argv[0]);
        return 64;
    }

    const fs::path input_path(argv[1]);
    const fs::path output_path(argv[2]);

    I3dmPack::InstancingSettings settings;
    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--no-batch-table") == 0) {
            settings.writeBatchTable = false;
        } else if (std::strcmp(argv[i], "--keep-nodes") == 0) {
            settings.pruneSourceNodes = false;
        } else if (std::strcmp(argv[i], "--keep-extension") == 0) {
            settings.stripInstancingExtension = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            print_usage(argv[0]);
            return 64;
        }
    }

    std::vector<uint8_t> glb;
    if (!read_file(input_path, glb)) {
        LOG_E("open file [%s] fail!", input_path.string().c_str());
        return 1;
    }

    I3dmPack::InstancingPipeline pipeline(settings);
    I3dmPack::ConversionResult result;
    try {
        result = pipeline.convert(glb.data(), glb.size());
    } catch (const I3dmPack::Core::UnsupportedAsset& e) {
        LOG_E("unsupported asset [%s]: %s", input_path.string().c_str(), e.what());
        return 2;
    } catch (const I3dmPack::Core::TileError& e) {
        LOG_E("convert [%s] failed: %s", input_path.string().c_str(), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_E("convert [%s] failed: %s", input_path.string().c_str(), e.what());
        return 1;
    }

    if (!write_file(output_path, result.bytes)) {
        LOG_E("write file %s fail", output_path.string().c_str());
        return 1;
    }
    LOG_I("wrote %s (%s, %zu tiles, %zu bytes)", output_path.string().c_str(),
          result.format.c_str(), result.tilesLength, result.bytes.size());
    return 0;
}
