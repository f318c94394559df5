// avcparse
#include <avcparse/common/logger.hpp>
#include <avcparse/h264/annexb_parser.hpp>

#include <plog/Log.h>

#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <variant>

using namespace avcparse;
using namespace avcparse::h264;

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

struct Summary {
    size_t access_units = 0;
    size_t keyframes = 0;
    size_t nalus = 0;
    std::map<ErrorCode, size_t> errors;
};

std::string Describe(const NalUnit& nalu) {
    return std::visit(utils::overloaded {
        [](const std::monostate&) { 
            return std::string(); 
        },
        [](const SpsParser::SpsState& sps) {
            return " id=" + std::to_string(sps.id) + " " + 
                   std::to_string(sps.width) + "x" + std::to_string(sps.height);
        },
        [](const PpsParser::PpsState& pps) {
            return " id=" + std::to_string(pps.id) + " sps_id=" + std::to_string(pps.sps_id);
        },
        [](const SliceHeader& header) {
            return std::string(" ") + ToString(header.slice_type) + 
                   " first_mb=" + std::to_string(header.first_mb_in_slice) + 
                   (header.fully_parsed ? " frame_num=" + std::to_string(header.frame_num) : "");
        },
        [](const std::vector<SeiMessage>& messages) {
            return " messages=" + std::to_string(messages.size());
        }
    }, nalu.syntax());
}

void Print(const AccessUnit& access_unit, size_t index, bool verbose, Summary& summary) {
    std::cout << "#" << index 
              << " offset=" << access_unit.stream_offset().value_or(0)
              << " kind=" << ToString(access_unit.kind())
              << (access_unit.is_keyframe() ? " keyframe" : "")
              << " nalus=" << access_unit.nalus().size();
    if (const SliceHeader* header = access_unit.first_slice_header()) {
        std::cout << " slice=" << ToString(header->slice_type);
    }
    if (auto sps = access_unit.sps()) {
        std::cout << " size=" << sps->width << "x" << sps->height
                  << " profile=" << sps->profile_idc << " level=" << sps->level_idc;
    }
    if (!access_unit.errors().empty()) {
        std::cout << " errors=" << access_unit.errors().size();
    }
    std::cout << std::endl;

    if (verbose) {
        for (const auto& nalu : access_unit.nalus()) {
            std::cout << "    " << nalu.stream_offset() << " " << ToString(nalu.type()) 
                      << " size=" << nalu.size() << Describe(nalu) << std::endl;
        }
    }

    ++summary.access_units;
    summary.nalus += access_unit.nalus().size();
    if (access_unit.is_keyframe()) {
        ++summary.keyframes;
    }
}

} // namespace

int main(int argc, const char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.h264> [-v]" << std::endl;
        return 1;
    }
    const std::string path = argv[1];
    const bool verbose = argc > 2 && std::string(argv[2]) == "-v";

    logging::InitLogger(verbose ? logging::Level::DEBUG : logging::Level::WARNING);

    std::ifstream source(path, std::ios::binary);
    if (!source.is_open()) {
        PLOG_ERROR << "Failed to open " << path;
        return 1;
    }

    Summary summary;
    AnnexBParser parser;
    parser.OnError([&summary](const ParseError& error){
        ++summary.errors[error.code];
    });

    BinaryBuffer chunk(kReadChunkSize);
    try {
        while (source) {
            source.read(reinterpret_cast<char*>(chunk.data()), chunk.size());
            const auto read_size = static_cast<size_t>(source.gcount());
            if (read_size == 0) {
                break;
            }
            parser.Push(chunk.data(), read_size);
            while (auto access_unit = parser.NextAccessUnit()) {
                Print(*access_unit, summary.access_units, verbose, summary);
            }
        }
        while (auto access_unit = parser.Flush()) {
            Print(*access_unit, summary.access_units, verbose, summary);
        }
    } catch (const ParseException& exception) {
        PLOG_ERROR << "Parsing aborted: " << exception.what();
        return 1;
    }

    std::cout << "access units: " << summary.access_units 
              << ", keyframes: " << summary.keyframes 
              << ", NAL units: " << summary.nalus << std::endl;
    for (const auto& [code, count] : summary.errors) {
        std::cout << "  " << ToString(code) << ": " << count << std::endl;
    }

    return 0;
}
