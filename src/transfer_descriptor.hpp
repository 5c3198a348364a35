#ifndef TRANSFER_DESCRIPTOR_HPP
#define TRANSFER_DESCRIPTOR_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <functional>
#include <libtorrent/torrent_info.hpp>

// 种子中的单个文件
struct DescriptorFile {
    std::string path;    // 相对路径
    std::int64_t size;   // 文件大小（字节）
};

// 从种子数据解析出的只读元数据（add 时创建，之后不再修改）
struct TransferDescriptor {
    std::string fingerprint;                  // info_hash 十六进制字符串
    std::string name;
    std::int64_t total_size = 0;
    int piece_count = 0;
    int piece_length = 0;
    std::vector<DescriptorFile> files;
    std::vector<std::string> trackers;        // announce 地址
    std::shared_ptr<const lt::torrent_info> info;
};

// 由 tracker 客户端提供：根据内容 ID 返回种子数据
using DescriptorSupplier = std::function<std::vector<char>(const std::string& content_id)>;

// 解析种子数据，格式错误时抛出 ParseError
TransferDescriptor parse_descriptor(const std::vector<char>& bytes);

// 读取 torrent 文件内容，无法读取时抛出 ParseError
std::vector<char> read_descriptor_file(const std::string& torrent_path);

// 从 torrent_info 获取 info_hash 字符串
std::string info_hash_string(const lt::torrent_info& ti);

#endif // TRANSFER_DESCRIPTOR_HPP
