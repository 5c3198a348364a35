#include "transfer_descriptor.hpp"
#include "transfer_errors.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <filesystem>
#include <libtorrent/error_code.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/announce_entry.hpp>
#include <libtorrent/file_storage.hpp>

std::string info_hash_string(const lt::torrent_info& ti)
{
    // v1 种子使用 SHA-1，纯 v2 种子使用截断的 SHA-256
    lt::sha1_hash hash = ti.info_hashes().get_best();
    std::ostringstream oss;
    oss << hash;
    return oss.str();
}

TransferDescriptor parse_descriptor(const std::vector<char>& bytes)
{
    if (bytes.empty()) {
        throw ParseError("种子数据为空");
    }

    lt::error_code ec;
    auto ti = std::make_shared<lt::torrent_info>(
        lt::span<char const>(bytes.data(), static_cast<std::ptrdiff_t>(bytes.size())),
        ec, lt::from_span);
    if (ec) {
        throw ParseError(ec.message());
    }

    const lt::file_storage& fs = ti->files();
    if (ti->num_files() <= 0) {
        throw ParseError("种子中没有文件");
    }
    if (ti->piece_length() <= 0 || ti->num_pieces() <= 0) {
        throw ParseError("分片信息无效");
    }

    TransferDescriptor descriptor;
    descriptor.fingerprint = info_hash_string(*ti);
    descriptor.name = ti->name();
    descriptor.total_size = ti->total_size();
    descriptor.piece_count = ti->num_pieces();
    descriptor.piece_length = ti->piece_length();

    for (lt::file_index_t i : fs.file_range()) {
        // 跳过 BEP 47 填充文件
        if (fs.pad_file_at(i)) {
            continue;
        }
        descriptor.files.push_back(DescriptorFile{fs.file_path(i), fs.file_size(i)});
    }

    for (const lt::announce_entry& tracker : ti->trackers()) {
        descriptor.trackers.push_back(tracker.url);
    }

    descriptor.info = ti;
    return descriptor;
}

std::vector<char> read_descriptor_file(const std::string& torrent_path)
{
    namespace fs = std::filesystem;

    // 验证 torrent 文件是否存在
    if (!fs::exists(torrent_path)) {
        throw ParseError("Torrent 文件不存在: " + torrent_path);
    }

    std::ifstream torrent_file(torrent_path, std::ios::binary);
    if (!torrent_file.is_open()) {
        throw ParseError("无法打开 torrent 文件: " + torrent_path);
    }

    return std::vector<char>(std::istreambuf_iterator<char>(torrent_file),
                             std::istreambuf_iterator<char>());
}
