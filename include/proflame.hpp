#pragma once

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <memory_resource>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>

namespace proflame {
// 树节点的 children 表从这里分配, 一棵树必须在同一线程上构建、序列化和销毁
thread_local static inline std::pmr::unsynchronized_pool_resource pool;

inline constexpr std::string_view kRootName = "root";

class ProflameException : public std::runtime_error {
  public:
    explicit ProflameException(std::string_view message)
        : std::runtime_error(std::string("Proflame Error: ") + std::string(message)) {}
};

class MemoryException : public std::runtime_error {
  public:
    explicit MemoryException(std::string_view message)
        : std::runtime_error(std::string("Memory Error: ") + std::string(message)) {}
};

class FileNotFoundException : public std::runtime_error {
  public:
    explicit FileNotFoundException(std::string_view message)
        : std::runtime_error(std::string("File not found: ") + std::string(message)) {}
};

class OpenFileException : public std::runtime_error {
  public:
    explicit OpenFileException(std::string_view message)
        : std::runtime_error(std::string("Cannot open file: ") + std::string(message)) {}
};

class ParseException : public ProflameException {
  public:
    explicit ParseException(std::string_view message)
        : ProflameException(std::string("Parse Error: ") + std::string(message)) {}
};

class ProfileException : public ProflameException {
  public:
    explicit ProfileException(std::string_view message)
        : ProflameException(std::string("Profile Error: ") + std::string(message)) {}
};

class SerializationError : public ProflameException {
  public:
    explicit SerializationError(std::string_view message)
        : ProflameException(std::string("Serialization Error: ") + std::string(message)) {}
};

class ConfigException : public ProflameException {
  public:
    explicit ConfigException(std::string_view message)
        : ProflameException(std::string("Config Error: ") + std::string(message)) {}
};

class RenderException : public ProflameException {
  public:
    explicit RenderException(std::string_view message)
        : ProflameException(std::string("Render Error: ") + std::string(message)) {}
};

namespace {
inline std::string_view trim(std::string_view str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

struct MMapBuffer {
    void* addr = nullptr;
    size_t size = 0;

    explicit MMapBuffer(std::string_view filename) {
        const std::string path(filename);
        int fd = open(path.c_str(), O_RDONLY);
        if (fd == -1) {
            if (errno == ENOENT) throw FileNotFoundException(filename);
            throw OpenFileException(filename);
        }

        struct stat st {};
        if (fstat(fd, &st) == -1) {
            close(fd);
            throw OpenFileException(filename);
        }

        // 空文件不能 mmap, 直接给出空 view
        size = static_cast<size_t>(st.st_size);
        if (size > 0) {
            addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
            if (addr == MAP_FAILED) {
                addr = nullptr;
                close(fd);
                throw MemoryException("mmap failed");
            }
            madvise(addr, size, MADV_WILLNEED);
        }
        close(fd);
    }

    MMapBuffer(const MMapBuffer&) = delete;
    MMapBuffer& operator=(const MMapBuffer&) = delete;

    ~MMapBuffer() {
        if (addr != nullptr) {
            munmap(addr, size);
        }
    }

    std::string_view view() const {
        if (addr == nullptr) return {};
        return {static_cast<const char*>(addr), size};
    }
};

struct LineScanner {
    std::string_view buffer;
    size_t pos = 0;
    size_t line_number = 0;

    explicit LineScanner(std::string_view data) : buffer(data) {}

    // 获取下一行，trim 后返回；如果读完，返回空 view
    std::string_view next_trimmed_line() {
        if (pos >= buffer.size()) {
            return {};
        }

        size_t end = buffer.find('\n', pos);
        if (end == std::string_view::npos) end = buffer.size();

        std::string_view line = buffer.substr(pos, end - pos);
        pos = end + 1;
        line_number++;

        return trim(line);
    }

    bool eof() const {
        return pos >= buffer.size();
    }
};

inline std::string_view file_suffix(std::string_view path) {
    size_t last_dot = path.find_last_of('.');
    if (last_dot == std::string_view::npos || last_dot == path.size() - 1) {
        return {};
    }

    // 点必须在最后一个路径分隔符之后, 兼容 Windows 和 Unix
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash != std::string_view::npos && last_dot < last_slash) {
        return {};
    }

    return path.substr(last_dot + 1);
}

inline std::string_view base_name(std::string_view path) {
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash == std::string_view::npos) {
        return path;
    }
    return path.substr(last_slash + 1);
}

inline std::vector<std::string_view> split(std::string_view str, char delimiter) {
    std::vector<std::string_view> tokens;

    size_t start = 0;
    while (true) {
        size_t end = str.find(delimiter, start);
        if (end == std::string_view::npos) {
            tokens.emplace_back(str.substr(start));
            break;
        }
        tokens.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }

    return tokens;
}

template <typename Int>
bool parse_integer(std::string_view token, Int& out) {
    if (token.empty()) return false;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

inline std::string escape_xml(std::string_view str) {
    std::string escaped;
    size_t reserve_size = str.size() + (str.size() / 5); // 预留 0.2 的空间
    escaped.reserve(reserve_size);

    for (char c : str) {
        switch (c) {
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '&':
                escaped += "&amp;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&#39;";
                break;
            default:
                escaped += c;
                break;
        }
    }
    return escaped;
}

// 查询参数编码, 空格转 '+', 其余保留字符转 %XX
inline std::string escape_query(std::string_view str) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(str.size());

    for (char c : str) {
        auto byte = static_cast<unsigned char>(c);
        if ((byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') || (byte >= '0' && byte <= '9') ||
            byte == '-' || byte == '_' || byte == '.' || byte == '~') {
            escaped += c;
        } else if (byte == ' ') {
            escaped += '+';
        } else {
            escaped += '%';
            escaped += kHex[byte >> 4];
            escaped += kHex[byte & 0x0F];
        }
    }
    return escaped;
}

inline MMapBuffer read_asset(std::string_view dir, std::string_view filename) {
    std::filesystem::path full_path = std::filesystem::path(std::string(dir)) / std::string(filename);
    return MMapBuffer(full_path.string());
}

} // namespace

// 🔥 ===== Profile 数据模型 =====
// 与 pprof 相同的约定: Sample::locations[0] 是叶子(采样点), 最后一个最靠近程序入口;
// Location::lines 有多个时表示内联, 最后一个是外层调用者
struct ValueType {
    std::string type;
    std::string unit;
};

struct Function {
    uint64_t id = 0;
    std::string name;
    std::string system_name;
    std::string filename;
};

struct Mapping {
    uint64_t id = 0;
    std::string file;
};

struct Line {
    const Function* function = nullptr;
    int64_t line = 0;
};

struct Location {
    uint64_t id = 0;
    const Mapping* mapping = nullptr;
    uint64_t address = 0;
    std::vector<Line> lines;
};

struct Sample {
    std::vector<const Location*> locations;
    std::vector<int64_t> values;
};

class Profile {
  public:
    std::vector<ValueType> sample_types;
    std::string default_sample_type;
    std::vector<Sample> samples;
    int64_t time_nanos = 0;
    int64_t duration_nanos = 0;
    // 解析时跳过的内容等非致命问题, 和选择 sample type 的错误一起显示在页面上
    std::vector<std::string> warnings;

    Profile() = default;
    Profile(Profile&&) = default;
    Profile& operator=(Profile&&) = default;
    Profile(const Profile&) = delete;
    Profile& operator=(const Profile&) = delete;

    const Function* add_function(std::string_view name, std::string_view filename = {}) {
        auto function = std::make_unique<Function>();
        function->id = functions_.size() + 1;
        function->name = std::string(name);
        function->system_name = std::string(name);
        function->filename = std::string(filename);
        functions_.push_back(std::move(function));
        return functions_.back().get();
    }

    const Mapping* add_mapping(std::string_view file) {
        auto mapping = std::make_unique<Mapping>();
        mapping->id = mappings_.size() + 1;
        mapping->file = std::string(file);
        mappings_.push_back(std::move(mapping));
        return mappings_.back().get();
    }

    const Location* add_location(std::vector<Line> lines, const Mapping* mapping = nullptr, uint64_t address = 0) {
        auto location = std::make_unique<Location>();
        location->id = locations_.size() + 1;
        location->mapping = mapping;
        location->address = address;
        location->lines = std::move(lines);
        locations_.push_back(std::move(location));
        return locations_.back().get();
    }

    Sample& add_sample(std::vector<const Location*> locations, std::vector<int64_t> values) {
        samples.push_back(Sample{std::move(locations), std::move(values)});
        return samples.back();
    }

    const std::vector<std::unique_ptr<Function>>& functions() const {
        return functions_;
    }

    const std::vector<std::unique_ptr<Mapping>>& mappings() const {
        return mappings_;
    }

    const std::vector<std::unique_ptr<Location>>& locations() const {
        return locations_;
    }

    void check_valid() const {
        if (sample_types.empty()) {
            throw ProfileException("profile has no sample types");
        }
        for (size_t i = 0; i < samples.size(); ++i) {
            const Sample& sample = samples[i];
            if (sample.values.size() != sample_types.size()) {
                throw ProfileException("sample #" + std::to_string(i) + " has " + std::to_string(sample.values.size()) +
                                       " values, expected " + std::to_string(sample_types.size()));
            }
            for (const Location* location : sample.locations) {
                if (location == nullptr) {
                    throw ProfileException("sample #" + std::to_string(i) + " references a null location");
                }
            }
        }
    }

    // 接受类型名、旧版 inuse_ 前缀或十进制下标; 无法解析时返回 nullopt
    std::optional<size_t> sample_index_by_name(std::string_view name) const {
        if (name.empty()) {
            return std::nullopt;
        }

        size_t index = 0;
        if (parse_integer(name, index)) {
            if (index < sample_types.size()) return index;
            return std::nullopt;
        }

        std::string_view no_inuse = name;
        if (no_inuse.substr(0, 6) == "inuse_") {
            no_inuse.remove_prefix(6);
        }
        for (size_t i = 0; i < sample_types.size(); ++i) {
            if (sample_types[i].type == name || sample_types[i].type == no_inuse) {
                return i;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> sample_type_names() const {
        std::vector<std::string> names;
        names.reserve(sample_types.size());
        for (const auto& type : sample_types) {
            names.push_back(type.type);
        }
        return names;
    }

  private:
    std::vector<std::unique_ptr<Function>> functions_;
    std::vector<std::unique_ptr<Mapping>> mappings_;
    std::vector<std::unique_ptr<Location>> locations_;
};

// 把样本展开成函数名序列, 叶子在前; 内联函数各占一层
inline void resolve_stack(const Sample& sample, std::vector<std::string_view>& stack) {
    stack.clear();
    for (const Location* location : sample.locations) {
        for (const Line& line : location->lines) {
            if (line.function != nullptr) {
                stack.emplace_back(line.function->name);
            }
        }
    }
}

inline std::vector<std::string_view> resolve_stack(const Sample& sample) {
    std::vector<std::string_view> stack;
    resolve_stack(sample, stack);
    return stack;
}

// 非致命问题(例如无法解析的 sample type)收集在这里, 最终显示在页面的 errors 区域
class Diagnostics {
  public:
    void report(std::string message) {
        messages_.push_back(std::move(message));
    }

    bool empty() const {
        return messages_.empty();
    }

    const std::vector<std::string>& messages() const {
        return messages_;
    }

  private:
    std::vector<std::string> messages_;
};

// 🔥 ===== 火焰图树 =====
struct FlameNode {
    std::string name;
    int64_t value = 0;
    // key 指向子节点自己的 name, 子节点在堆上不会移动
    std::pmr::unordered_map<std::string_view, FlameNode*> children;

    explicit FlameNode(std::string_view name = kRootName) : name(name), children(&pool) {}

    // 禁用拷贝/移动构造函数
    FlameNode(FlameNode&& other) noexcept = delete;
    FlameNode& operator=(FlameNode&& other) noexcept = delete;
    FlameNode(const FlameNode&) = delete;
    FlameNode& operator=(const FlameNode&) = delete;

    // 不递归析构, 整棵树由 FlameNodeRoot 释放
    ~FlameNode() = default;

    FlameNode* get_or_create_child(std::string_view child_name) {
        auto it = children.find(child_name);
        if (it != children.end()) { // 已经存在
            return it->second;
        }

        auto new_node = std::make_unique<FlameNode>(child_name);
        FlameNode* raw = new_node.get();
        children.emplace(std::string_view(raw->name), raw);
        new_node.release();
        return raw;
    }

    const FlameNode* find_child(std::string_view child_name) const {
        auto it = children.find(child_name);
        return it == children.end() ? nullptr : it->second;
    }

    // stack 叶子在前: 从末尾(程序入口)走到开头(采样点), 路径上每一层都累加 value
    void add(const std::vector<std::string_view>& stack, int64_t sample_value) {
        FlameNode* current = this;
        current->value += sample_value;
        for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
            current = current->get_or_create_child(*it);
            current->value += sample_value;
        }
    }

    // 根下最长链的节点数
    size_t depth() const {
        size_t max_depth = 0;
        std::vector<std::pair<const FlameNode*, size_t>> stk;
        stk.emplace_back(this, 0);
        while (! stk.empty()) {
            auto [curr, d] = stk.back();
            stk.pop_back();
            max_depth = std::max(max_depth, d);
            for (const auto& [_, child] : curr->children) {
                stk.emplace_back(child, d + 1);
            }
        }
        return max_depth;
    }
};

struct FlameNodeRoot {
    FlameNode* node;

    FlameNodeRoot() : node(new FlameNode(kRootName)) {}

    FlameNodeRoot(FlameNodeRoot&& other) noexcept : node(std::exchange(other.node, nullptr)) {}
    FlameNodeRoot& operator=(FlameNodeRoot&&) = delete;
    FlameNodeRoot(const FlameNodeRoot&) = delete;
    FlameNodeRoot& operator=(const FlameNodeRoot&) = delete;

    ~FlameNodeRoot() {
        if (node == nullptr) return;

        // 选择 stack 而不是 queue, DFS 峰值为树的最大深度, 火焰图通常宽而不深
        std::vector<FlameNode*> stk;
        stk.reserve(128);
        stk.push_back(node);

        while (! stk.empty()) {
            FlameNode* curr = stk.back();
            stk.pop_back();

            for (auto& [_, child] : curr->children) {
                if (child) stk.push_back(child);
            }
            delete curr;
        }
    }

    FlameNode& operator*() const {
        return *node;
    }

    FlameNode* operator->() const {
        return node;
    }
};

class FlameGraphBuilder {
  public:
    // 要求 profile 已通过 check_valid(), sample_index 在 sample_types 范围内
    void build_tree(FlameNode& root, const std::vector<Sample>& samples, size_t sample_index) const {
        std::vector<std::string_view> stack;
        stack.reserve(64);
        for (const auto& sample : samples) {
            resolve_stack(sample, stack);
            root.add(stack, sample.values[sample_index]);
        }
    }

    FlameNodeRoot build_tree(const Profile& profile, size_t sample_index) const {
        FlameNodeRoot root;
        build_tree(*root, profile.samples, sample_index);
        return root;
    }
};

// 🔥 ===== JSON 序列化 =====
class FlameGraphSerializer {
  public:
    // {"name":..., "value":..., "children":[...]}, children 按名字排序以保证输出稳定
    std::string to_json(const FlameNode& root) const {
        struct Pending {
            std::vector<const FlameNode*> children;
            size_t next = 0;
        };

        std::string out;
        std::vector<Pending> stk;

        auto open_node = [&](const FlameNode& node) {
            out += "{\"name\":";
            append_json_string(out, node.name);
            out += ",\"value\":";
            out += std::to_string(node.value);
            out += ",\"children\":[";
            stk.push_back(Pending{sorted_children(node), 0});
        };

        open_node(root);
        while (! stk.empty()) {
            Pending& top = stk.back();
            if (top.next < top.children.size()) {
                if (top.next > 0) out += ',';
                const FlameNode* child = top.children[top.next++];
                open_node(*child);
            } else {
                out += "]}";
                stk.pop_back();
            }
        }

        return out;
    }

    static std::vector<const FlameNode*> sorted_children(const FlameNode& node) {
        std::vector<const FlameNode*> children;
        children.reserve(node.children.size());
        for (const auto& [_, child] : node.children) {
            children.push_back(child);
        }
        std::sort(children.begin(), children.end(),
                  [](const FlameNode* a, const FlameNode* b) { return a->name < b->name; });
        return children;
    }

    // 校验 UTF-8 并转义; <, >, & 和 U+2028/U+2029 也转义, 保证可以直接嵌入 <script>
    static void append_json_string(std::string& out, std::string_view text) {
        static constexpr uint32_t kMinCodePoint[] = {0, 0, 0x80, 0x800, 0x10000};

        out += '"';
        size_t i = 0;
        while (i < text.size()) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (c < 0x80) {
                append_ascii(out, static_cast<char>(c));
                ++i;
                continue;
            }

            size_t len = 0;
            uint32_t code_point = 0;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                code_point = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                code_point = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                code_point = c & 0x07;
            } else {
                throw_invalid_utf8(text, i);
            }

            if (i + len > text.size()) {
                throw_invalid_utf8(text, i);
            }
            for (size_t k = 1; k < len; ++k) {
                const auto cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    throw_invalid_utf8(text, i);
                }
                code_point = (code_point << 6) | (cc & 0x3F);
            }
            if (code_point < kMinCodePoint[len] || code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                throw_invalid_utf8(text, i);
            }

            if (code_point == 0x2028) {
                out += "\\u2028";
            } else if (code_point == 0x2029) {
                out += "\\u2029";
            } else {
                out.append(text.substr(i, len));
            }
            i += len;
        }
        out += '"';
    }

  private:
    static void append_ascii(std::string& out, char c) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '<':
                out += "\\u003c";
                break;
            case '>':
                out += "\\u003e";
                break;
            case '&':
                out += "\\u0026";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }

    [[noreturn]] static void throw_invalid_utf8(std::string_view text, size_t offset) {
        throw SerializationError("name is not valid UTF-8 at byte " + std::to_string(offset) + " of " +
                                 std::to_string(text.size()));
    }
};

// 🔥 ===== 配置 =====
struct FlameGraphConfig {
    std::string title;               // 空表示使用 profile 的文件名
    std::string default_sample_type; // 请求没有指定 sample type 时使用
    std::string base_url = "/flamegraph";
    std::string assets_dir;          // 空表示通过 URL 引用 d3

    int width = 0; // 0 表示填满容器
    int cell_height = 18;
    int min_frame_size = 5;
    int transition_duration = 750;
    bool sort = true;

    void validate() const {
        if (width < 0) {
            throw ConfigException("Width cannot be negative");
        }
        if (cell_height <= 0) {
            throw ConfigException("Cell height must be positive");
        }
        if (min_frame_size < 0) {
            throw ConfigException("Min frame size cannot be negative");
        }
        if (transition_duration < 0) {
            throw ConfigException("Transition duration cannot be negative");
        }
    }
};

struct RenderRequest {
    std::string sample_type; // 即 ?t= 参数
};

// 有请求参数时只看请求参数, 否则看配置的默认值; 解析失败都落到第 0 个 sample type
class SampleTypeSelector {
  public:
    static size_t select(const Profile& profile,
                         std::string_view requested,
                         std::string_view configured_default,
                         Diagnostics* diagnostics = nullptr) {
        std::string_view name = requested.empty() ? configured_default : requested;
        if (name.empty()) {
            return 0;
        }
        if (auto index = profile.sample_index_by_name(name)) {
            return *index;
        }
        if (diagnostics != nullptr) {
            diagnostics->report(unresolved_message(profile, name));
        }
        return 0;
    }

  private:
    static std::string unresolved_message(const Profile& profile, std::string_view name) {
        std::ostringstream oss;
        oss << "sample_index \"" << name << "\" must be one of: [";
        bool first = true;
        for (const auto& type : profile.sample_types) {
            if (! first) oss << ' ';
            oss << type.type;
            first = false;
        }
        oss << "]";
        return oss.str();
    }
};

// 🔥 ===== 图例 =====
struct ProfileLegend {
    static std::string file_name(const Profile& profile) {
        const auto& mappings = profile.mappings();
        if (mappings.empty() || mappings.front()->file.empty()) {
            return "unknown";
        }
        return std::string(base_name(mappings.front()->file));
    }

    static std::string legend_unit(std::string_view unit) {
        if (unit == "nanoseconds") return "seconds";
        return std::string(unit);
    }

    // 形如 "Jan 2, 2006 at 3:04pm (MST)", 本地时间
    static std::string format_time(int64_t time_nanos) {
        std::time_t seconds = static_cast<std::time_t>(time_nanos / 1000000000);
        std::tm tm {};
        localtime_r(&seconds, &tm);

        char month[16];
        char zone[16];
        std::strftime(month, sizeof(month), "%b", &tm);
        std::strftime(zone, sizeof(zone), "%Z", &tm);

        int hour12 = tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12;
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%s %d, %d at %d:%02d%s (%s)", month, tm.tm_mday, tm.tm_year + 1900, hour12,
                      tm.tm_min, tm.tm_hour < 12 ? "am" : "pm", zone);
        return buf;
    }

    static std::string format_duration(int64_t duration_nanos) {
        char buf[64];
        if (duration_nanos > 1000000000) {
            std::snprintf(buf, sizeof(buf), "%f s", static_cast<double>(duration_nanos) / 1000000000.0);
        } else {
            std::snprintf(buf, sizeof(buf), "%lld ns", static_cast<long long>(duration_nanos));
        }
        return buf;
    }

    static std::vector<std::string> lines(const Profile& profile, size_t sample_index) {
        const ValueType& type = profile.sample_types.at(sample_index);
        return {
            "File: " + file_name(profile),
            "Type: " + type.type,
            "Unit: " + legend_unit(type.unit),
            "Time: " + format_time(profile.time_nanos),
            "Duration: " + format_duration(profile.duration_nanos),
        };
    }
};

// 渲染一页所需的全部数据, data 是序列化好的树
struct FlamePage {
    std::string title;
    std::string base_url;
    std::vector<std::string> legend;
    std::string unit;
    std::string sample_type;
    std::vector<std::string> sample_types;
    std::vector<std::string> errors;
    std::string data;
};

// 🔥 ===== 渲染器 =====
class FlameGraphRenderer {
  protected:
    FlameGraphConfig config_;

    explicit FlameGraphRenderer(const FlameGraphConfig& config) : config_(config) {
        config_.validate();
    }

  public:
    virtual void render(const FlamePage& page, std::ostream& os) = 0;
    virtual std::string_view get_format() const = 0;
    virtual ~FlameGraphRenderer() = default;
};

class JsonFlameGraphRenderer : public FlameGraphRenderer {
  public:
    explicit JsonFlameGraphRenderer(const FlameGraphConfig& config = {}) : FlameGraphRenderer(config) {}

    void render(const FlamePage& page, std::ostream& os) override {
        os << page.data << '\n';
    }

    std::string_view get_format() const override {
        return "json";
    }
};

class HtmlFlameGraphRenderer : public FlameGraphRenderer {
  public:
    static constexpr std::string_view kD3Url = "https://d3js.org/d3.v7.min.js";
    static constexpr std::string_view kFlameGraphJsUrl =
        "https://cdn.jsdelivr.net/npm/d3-flame-graph@4.1.3/dist/d3-flamegraph.min.js";
    static constexpr std::string_view kFlameGraphTooltipUrl =
        "https://cdn.jsdelivr.net/npm/d3-flame-graph@4.1.3/dist/d3-flamegraph-tooltip.min.js";
    static constexpr std::string_view kFlameGraphCssUrl =
        "https://cdn.jsdelivr.net/npm/d3-flame-graph@4.1.3/dist/d3-flamegraph.css";

    explicit HtmlFlameGraphRenderer(const FlameGraphConfig& config = {}) : FlameGraphRenderer(config) {}

    void render(const FlamePage& page, std::ostream& os) override {
        os << R"(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <title>)" << escape_xml(page.title)
           << "</title>\n";
        write_stylesheet(os);
        os << R"(  <style>
    body { font-family: sans-serif; margin: 0 2%; }
    .legend { font-size: 12px; color: #444; }
    .types a { margin-right: 8px; }
    .types a.selected { font-weight: bold; }
    #errors div { color: #b00; }
    .flame { width: 80%; margin-left: 10%; }
  </style>
</head>
<body>
  <h1>)" << escape_xml(page.title)
           << "</h1>\n";

        os << "  <div class=\"legend\">\n";
        for (const auto& line : page.legend) {
            os << "    <div>" << escape_xml(line) << "</div>\n";
        }
        os << "  </div>\n";

        os << "  <div class=\"types\">\n";
        for (const auto& type : page.sample_types) {
            os << "    <a href=\"" << escape_xml(page.base_url) << "?t=" << escape_xml(escape_query(type)) << "\"";
            if (type == page.sample_type) {
                os << " class=\"selected\"";
            }
            os << ">" << escape_xml(type) << "</a>\n";
        }
        os << "  </div>\n";

        os << R"(  <div>
    <button id="resetzoom">Reset Zoom</button>
    <input id="search" type="text" placeholder="Search">
    <div class="flame">
      <div id="errors">)";
        for (const auto& error : page.errors) {
            os << "<div>" << escape_xml(error) << "</div>";
        }
        os << R"(</div>
      <div id="chart"></div>
    </div>
  </div>
)";
        write_scripts(os);

        std::string unit_json;
        FlameGraphSerializer::append_json_string(unit_json, page.unit);

        os << "  <script type=\"text/javascript\">\n";
        os << "    var data = " << page.data << ";\n";
        os << "    var unit = " << unit_json << ";\n";
        os << R"JS(    var formatValue = function(v) {
      if (unit === "nanoseconds") {
        return d3.format(".5f")(v / 1000000000) + " seconds";
      }
      return v + " " + unit;
    };
    var label = function(d) {
      return d.data.name + " (" + d3.format(".3f")(100 * (d.x1 - d.x0)) + "%, " + formatValue(d.data.value) + ")";
    };
)JS";
        if (config_.width > 0) {
            os << "    var width = " << config_.width << ";\n";
        } else {
            os << "    var width = document.getElementById(\"chart\").clientWidth;\n";
        }
        os << "    var chart = flamegraph()\n"
           << "      .width(width)\n"
           << "      .cellHeight(" << config_.cell_height << ")\n"
           << "      .minFrameSize(" << config_.min_frame_size << ")\n"
           << "      .transitionDuration(" << config_.transition_duration << ")\n"
           << "      .transitionEase(d3.easeCubic)\n"
           << "      .sort(" << (config_.sort ? "true" : "false") << ")\n"
           << "      .title(\"\")\n"
           << "      .label(label);\n";
        os << R"JS(
    var tip = flamegraph.tooltip.defaultFlamegraphTooltip()
      .html(function(d) { return "name: " + d.data.name + ", value: " + formatValue(d.data.value); });
    chart.tooltip(tip);

    d3.select("#chart").datum(data).call(chart);

    document.getElementById("search").addEventListener("input", function(e) {
      if (e.target.value === "") {
        chart.clear();
      } else {
        chart.search(e.target.value);
      }
    });
    document.getElementById("resetzoom").addEventListener("click", function() {
      chart.resetZoom();
    });
    window.addEventListener("resize", function() {
      var w = document.getElementById("chart").clientWidth;
      chart.width(w);
      chart.resetZoom();
    }, true);
  </script>
</body>
</html>
)JS";
    }

    std::string_view get_format() const override {
        return "html";
    }

  private:
    void write_stylesheet(std::ostream& os) const {
        if (config_.assets_dir.empty()) {
            os << "  <link rel=\"stylesheet\" href=\"" << kFlameGraphCssUrl << "\">\n";
            return;
        }
        auto css = read_asset(config_.assets_dir, "d3-flamegraph.css");
        os << "  <style>\n" << css.view() << "\n  </style>\n";
    }

    void write_scripts(std::ostream& os) const {
        if (config_.assets_dir.empty()) {
            os << "  <script type=\"text/javascript\" src=\"" << kD3Url << "\"></script>\n";
            os << "  <script type=\"text/javascript\" src=\"" << kFlameGraphJsUrl << "\"></script>\n";
            os << "  <script type=\"text/javascript\" src=\"" << kFlameGraphTooltipUrl << "\"></script>\n";
            return;
        }
        auto d3_js = read_asset(config_.assets_dir, "d3.v7.min.js");
        auto flamegraph_js = read_asset(config_.assets_dir, "d3-flamegraph.js");
        auto tooltip_js = read_asset(config_.assets_dir, "d3-flamegraph-tooltip.js");
        os << "  <script type=\"text/javascript\">\n" << d3_js.view() << "\n  </script>\n";
        os << "  <script type=\"text/javascript\">\n" << flamegraph_js.view() << "\n  </script>\n";
        os << "  <script type=\"text/javascript\">\n" << tooltip_js.view() << "\n  </script>\n";
    }
};

class FlameGraphRendererFactory {
    using CreatorFunc = std::function<std::unique_ptr<FlameGraphRenderer>(const FlameGraphConfig&)>;

    static const std::unordered_map<std::string_view, CreatorFunc>& get_render_map() {
        static const std::unordered_map<std::string_view, CreatorFunc> render_map = {
            {"html", [](const FlameGraphConfig& c) { return std::make_unique<HtmlFlameGraphRenderer>(c); }},
            { "htm", [](const FlameGraphConfig& c) { return std::make_unique<HtmlFlameGraphRenderer>(c); }},
            {"json", [](const FlameGraphConfig& c) { return std::make_unique<JsonFlameGraphRenderer>(c); }},
        };
        return render_map;
    }

  public:
    static std::unique_ptr<FlameGraphRenderer> create(std::string_view format, const FlameGraphConfig& config = {}) {
        const auto& map = get_render_map();
        auto it = map.find(format);
        if (it != map.end()) {
            return it->second(config);
        }
        // 未知默认返回 html
        return std::make_unique<HtmlFlameGraphRenderer>(config);
    }
};

// 🔥 ===== 渲染绑定: 选择 sample type -> 建树 -> 序列化 -> 页面 =====
class FlameGraphView {
  private:
    const Profile& profile_;
    FlameGraphConfig config_;

  public:
    explicit FlameGraphView(const Profile& profile, const FlameGraphConfig& config = {})
        : profile_(profile), config_(config) {
        config_.validate();
        profile_.check_valid();
    }

    // 配置没有默认值时, 退回到 profile 自己声明的默认 sample type
    std::string_view configured_default() const {
        if (! config_.default_sample_type.empty()) {
            return config_.default_sample_type;
        }
        return profile_.default_sample_type;
    }

    size_t select_sample_index(const RenderRequest& request, Diagnostics* diagnostics = nullptr) const {
        return SampleTypeSelector::select(profile_, request.sample_type, configured_default(), diagnostics);
    }

    FlamePage prepare(const RenderRequest& request) const {
        Diagnostics diagnostics;
        for (const auto& warning : profile_.warnings) {
            diagnostics.report(warning);
        }
        size_t index = select_sample_index(request, &diagnostics);

        FlameGraphBuilder builder;
        FlameGraphSerializer serializer;

        FlamePage page;
        {
            FlameNodeRoot root = builder.build_tree(profile_, index);
            page.data = serializer.to_json(*root);
        }

        const ValueType& type = profile_.sample_types[index];
        page.title = config_.title.empty() ? ProfileLegend::file_name(profile_) : config_.title;
        page.base_url = config_.base_url;
        page.legend = ProfileLegend::lines(profile_, index);
        page.unit = type.unit;
        page.sample_type = type.type;
        page.sample_types = profile_.sample_type_names();
        page.errors = diagnostics.messages();
        return page;
    }

    std::string render(const RenderRequest& request, std::string_view format = "html") const {
        FlamePage page = prepare(request);
        std::ostringstream oss;
        FlameGraphRendererFactory::create(format, config_)->render(page, oss);
        return oss.str();
    }

    const FlameGraphConfig& get_config() const {
        return config_;
    }
};

// 🔥 ===== 解析器基类和实现 =====
class AbstractProfileParser {
  public:
    virtual ~AbstractProfileParser() = default;

    virtual Profile parse(std::string_view buffer) = 0;
    virtual std::string_view get_parser_name() const = 0;
};

// 按名字复用 Function / Mapping / Location
class ProfileInterner {
  public:
    explicit ProfileInterner(Profile& profile) : profile_(profile) {}

    const Location* location(std::string_view func_name, std::string_view dso = {}) {
        std::string key(dso);
        key += '\0';
        key += func_name;

        auto it = locations_.find(key);
        if (it != locations_.end()) {
            return it->second;
        }

        const Mapping* mapping_ptr = dso.empty() ? nullptr : mapping(dso);
        const Location* loc = profile_.add_location({Line{function(func_name), 0}}, mapping_ptr);
        locations_.emplace(std::move(key), loc);
        return loc;
    }

  private:
    const Function* function(std::string_view name) {
        auto it = functions_.find(std::string(name));
        if (it != functions_.end()) {
            return it->second;
        }
        const Function* fn = profile_.add_function(name);
        functions_.emplace(std::string(name), fn);
        return fn;
    }

    const Mapping* mapping(std::string_view file) {
        auto it = mappings_.find(std::string(file));
        if (it != mappings_.end()) {
            return it->second;
        }
        const Mapping* m = profile_.add_mapping(file);
        mappings_.emplace(std::string(file), m);
        return m;
    }

    Profile& profile_;
    std::unordered_map<std::string, const Function*> functions_;
    std::unordered_map<std::string, const Mapping*> mappings_;
    std::unordered_map<std::string, const Location*> locations_;
};

/**
 * @brief 适配 perf script 收集的堆栈
 *
 * 两个 sample type: samples/count 以及第一个事件的 period
 */
class PerfScriptParser : public AbstractProfileParser {
  public:
    Profile parse(std::string_view buffer) override {
        Profile profile;
        ProfileInterner interner(profile);
        std::vector<const Location*> current_stack;
        SampleHeader header;
        bool reading_stack = false;
        bool have_first = false;
        int64_t first_ts = 0;
        int64_t last_ts = 0;
        size_t skipped_frames = 0;
        LineScanner scanner(buffer);

        auto finish_sample = [&]() {
            if (! have_first) {
                profile.sample_types = {
                    {"samples", "count"},
                    {header.event.empty() ? std::string("period") : header.event, event_unit(header.event)},
                };
                first_ts = header.timestamp_nanos;
                have_first = true;
            }
            last_ts = header.timestamp_nanos;
            profile.add_sample(std::move(current_stack), {1, header.period});
            current_stack.clear();
            reading_stack = false;
        };

        while (true) {
            std::string_view trimmed_line = scanner.next_trimmed_line();
            if (trimmed_line.empty() && scanner.eof()) break;

            if (trimmed_line.empty()) { // 空行：当前 stack 结束
                if (reading_stack) {
                    finish_sample();
                }
            } else if (! reading_stack && trimmed_line.find(':') != std::string_view::npos) {
                header = parse_sample_header(trimmed_line);
                reading_stack = true;
            } else if (reading_stack) {
                std::string name;
                std::string_view dso;
                if (parse_perf_stack_frame(trimmed_line, name, dso)) {
                    current_stack.push_back(interner.location(name, dso));
                } else {
                    skipped_frames++;
                }
            }
        }

        // 文件结束后，最后一个样本（如果有）
        if (reading_stack) {
            finish_sample();
        }

        if (profile.samples.empty()) {
            throw ParseException("No valid samples found in perf script input");
        }

        if (skipped_frames > 0) {
            profile.warnings.push_back("skipped " + std::to_string(skipped_frames) +
                                       " unrecognized stack frame(s) in perf script input");
        }

        profile.time_nanos = first_ts;
        profile.duration_nanos = last_ts > first_ts ? last_ts - first_ts : 0;
        profile.check_valid();
        return profile;
    }

    std::string_view get_parser_name() const override {
        return "PerfScriptParser";
    }

  private:
    struct SampleHeader {
        int64_t timestamp_nanos = 0;
        int64_t period = 1;
        std::string event;
    };

    static std::string event_unit(std::string_view event) {
        if (event.find("clock") != std::string_view::npos) {
            return "nanoseconds";
        }
        return "count";
    }

    // i.e. testprog         12345 1748678782.171698:     250000 cpu-clock:u:
    static SampleHeader parse_sample_header(std::string_view line_view) {
        SampleHeader header;

        size_t colon = line_view.find(':');
        size_t start = line_view.rfind(' ', colon);
        if (start != std::string_view::npos && start < colon) {
            header.timestamp_nanos = parse_timestamp(line_view.substr(start + 1, colon - start - 1));
        }

        std::string_view rest = trim(line_view.substr(colon + 1));
        size_t space = rest.find_first_of(" \t");
        std::string_view first = rest.substr(0, space);
        int64_t period = 0;
        if (parse_integer(first, period)) {
            header.period = period;
            rest = space == std::string_view::npos ? std::string_view{} : trim(rest.substr(space));
        }

        std::string_view event = rest.substr(0, rest.find_first_of(" \t:"));
        header.event = std::string(event);
        return header;
    }

    static int64_t parse_timestamp(std::string_view text) {
        size_t dot = text.find('.');
        int64_t seconds = 0;
        if (! parse_integer(text.substr(0, dot), seconds)) {
            return 0;
        }
        int64_t nanos = 0;
        if (dot != std::string_view::npos) {
            std::string fraction(text.substr(dot + 1, 9));
            fraction.resize(9, '0');
            if (! parse_integer(std::string_view(fraction), nanos)) {
                nanos = 0;
            }
        }
        return seconds * 1000000000 + nanos;
    }

    // i.e. "7f0b8bf5766d malloc+0x5d (/usr/lib/libc.so.6)"
    static bool parse_perf_stack_frame(std::string_view line, std::string& name, std::string_view& dso) {
        size_t first_space = line.find(' '); // 跳过 address
        if (first_space == std::string_view::npos) return false;

        std::string_view content = trim(line.substr(first_space + 1));
        std::string_view func_name{};
        std::string_view lib_name{};

        size_t paren_start = content.rfind('(');
        size_t paren_end = paren_start == std::string_view::npos ? paren_start : content.find(')', paren_start);

        if (paren_start != std::string_view::npos && paren_end != std::string_view::npos) {
            lib_name = content.substr(paren_start + 1, paren_end - paren_start - 1);
            func_name = trim(content.substr(0, paren_start));
        } else {
            func_name = content;
        }

        if (func_name != "[unknown]") {
            size_t plus_pos = func_name.find('+');
            if (plus_pos != std::string_view::npos) {
                func_name = func_name.substr(0, plus_pos);
            }
        }

        dso = lib_name;
        if (! func_name.empty() && func_name != "[unknown]") {
            name = std::string(func_name);
            return true;
        }
        if (lib_name.empty()) {
            return false;
        }

        // 没有 func_name 则使用 lib 替代, 已经是 [xxx] 的不再加括号
        std::string_view short_lib = base_name(lib_name);
        if (short_lib.empty()) short_lib = lib_name;
        if (short_lib.front() == '[' && short_lib.back() == ']') {
            name = std::string(short_lib);
        } else {
            name = "[" + std::string(short_lib) + "]";
        }
        return true;
    }
};

/**
 * @brief 折叠格式 "main;foo;bar 10 20", 调用栈从入口到叶子
 *
 * 可选的文件头:
 *   # sample_types: cpu/nanoseconds alloc_space/bytes
 *   # default_sample_type: cpu
 */
class FoldedStackParser : public AbstractProfileParser {
  public:
    Profile parse(std::string_view buffer) override {
        Profile profile;
        ProfileInterner interner(profile);
        LineScanner scanner(buffer);

        while (true) {
            std::string_view line = scanner.next_trimmed_line();
            if (line.empty() && scanner.eof()) break;
            if (line.empty()) continue;

            if (line[0] == '#') {
                parse_header(line, profile, scanner.line_number);
                continue;
            }

            if (profile.sample_types.empty()) {
                profile.sample_types = {{"samples", "count"}};
            }
            parse_stack_line(line, profile, interner, scanner.line_number);
        }

        if (profile.samples.empty()) {
            throw ParseException("No valid samples found in folded input");
        }

        profile.check_valid();
        return profile;
    }

    std::string_view get_parser_name() const override {
        return "FoldedStackParser";
    }

  private:
    static void parse_header(std::string_view line, Profile& profile, size_t line_number) {
        std::string_view body = trim(line.substr(1));
        size_t colon = body.find(':');
        if (colon == std::string_view::npos) return; // 普通注释

        std::string_view key = trim(body.substr(0, colon));
        std::string_view value = trim(body.substr(colon + 1));

        if (key == "sample_types") {
            if (! profile.samples.empty()) {
                throw ParseException("sample_types header after samples at line " + std::to_string(line_number));
            }
            profile.sample_types.clear();
            for (std::string_view token : split(value, ' ')) {
                token = trim(token);
                if (token.empty()) continue;
                size_t slash = token.find('/');
                if (slash == std::string_view::npos) {
                    profile.sample_types.push_back({std::string(token), "count"});
                } else {
                    profile.sample_types.push_back(
                        {std::string(token.substr(0, slash)), std::string(token.substr(slash + 1))});
                }
            }
            if (profile.sample_types.empty()) {
                throw ParseException("empty sample_types header at line " + std::to_string(line_number));
            }
        } else if (key == "default_sample_type") {
            profile.default_sample_type = std::string(value);
        }
    }

    static void
    parse_stack_line(std::string_view line, Profile& profile, ProfileInterner& interner, size_t line_number) {
        const size_t value_count = profile.sample_types.size();
        std::vector<int64_t> values(value_count);
        std::string_view rest = line;

        for (size_t k = value_count; k-- > 0;) {
            rest = trim(rest);
            size_t space = rest.find_last_of(" \t");
            if (space == std::string_view::npos) {
                throw ParseException("expected " + std::to_string(value_count) + " values at line " +
                                     std::to_string(line_number));
            }
            std::string_view token = rest.substr(space + 1);
            if (! parse_integer(token, values[k])) {
                throw ParseException("invalid value '" + std::string(token) + "' at line " +
                                     std::to_string(line_number));
            }
            rest = rest.substr(0, space);
        }

        // 输入从入口到叶子, Sample 需要叶子在前
        std::vector<const Location*> locations;
        for (std::string_view frame : split(trim(rest), ';')) {
            frame = trim(frame);
            if (! frame.empty()) {
                locations.push_back(interner.location(frame));
            }
        }
        std::reverse(locations.begin(), locations.end());

        profile.add_sample(std::move(locations), std::move(values));
    }
};

class AutoDetectParser : public AbstractProfileParser {
  private:
    std::unique_ptr<AbstractProfileParser> actual_parser_;
    static constexpr size_t MAX_PREVIEW_LINE = 128;

  public:
    Profile parse(std::string_view buffer) override {
        detect_format(buffer);
        return actual_parser_->parse(buffer);
    }

    std::string_view get_parser_name() const override {
        return "AutoDetectParser";
    }

    std::string get_using_parser() const {
        std::ostringstream oss;
        if (actual_parser_) {
            oss << "AutoDetect(" << actual_parser_->get_parser_name() << ")";
        } else {
            oss << "AutoDetect(Unknown)";
        }
        return oss.str();
    }

  private:
    void detect_format(std::string_view buffer) {
        LineScanner scanner(buffer);
        bool has_perf_format = false;

        while (! scanner.eof() && scanner.line_number < MAX_PREVIEW_LINE) {
            std::string_view line = scanner.next_trimmed_line();
            if (! line.empty() && line[0] != '#' && is_like_perf(line)) {
                has_perf_format = true;
                break;
            }
        }

        if (has_perf_format) {
            actual_parser_ = std::make_unique<PerfScriptParser>();
        } else {
            actual_parser_ = std::make_unique<FoldedStackParser>();
        }
    }

    static bool is_like_perf(std::string_view line) {
        return has_timestamp_token(line) || is_frame_line(line);
    }

    // 样本头: "prog 1234 100.000000000: 250000 cpu-clock:u:"
    static bool has_timestamp_token(std::string_view line) {
        for (std::string_view token : split(line, ' ')) {
            token = trim(token);
            if (token.size() < 4 || token.back() != ':') continue;
            token.remove_suffix(1);
            size_t dot = token.find('.');
            if (dot == std::string_view::npos || dot == 0 || dot + 1 == token.size()) continue;
            if (is_digits(token.substr(0, dot)) && is_digits(token.substr(dot + 1))) {
                return true;
            }
        }
        return false;
    }

    // 帧行: 十六进制地址 + 符号 + (dso), 折叠格式的行总以数字结尾
    static bool is_frame_line(std::string_view line) {
        size_t space = line.find_first_of(" \t");
        if (space == 0 || space == std::string_view::npos) return false;
        std::string_view address = line.substr(0, space);
        return address.find_first_not_of("0123456789abcdef") == std::string_view::npos && line.back() == ')' &&
               line.find('(', space) != std::string_view::npos;
    }

    static bool is_digits(std::string_view text) {
        return ! text.empty() && text.find_first_not_of("0123456789") == std::string_view::npos;
    }
};

// 🔥 ===== 主入口类 =====
class FlameGraphGenerator {
  private:
    FlameGraphConfig config_;

  public:
    explicit FlameGraphGenerator(const FlameGraphConfig& config = {}) : config_(config) {
        config_.validate();
    }

    Profile load(std::string_view raw_file) const {
        MMapBuffer buffer(raw_file);
        AutoDetectParser parser;
        return parser.parse(buffer.view());
    }

    // 返回页面上报告的非致命问题
    std::vector<std::string>
    generate(std::string_view raw_file, std::string_view out_file, const RenderRequest& request = {}) {
        auto suffix = file_suffix(out_file);
        if (suffix.empty()) {
            throw ProflameException(std::string("File suffix empty: ") + std::string(out_file));
        }

        try {
            Profile profile = load(raw_file);
            FlameGraphView view(profile, config_);
            FlamePage page = view.prepare(request);
            write_page(page, suffix, out_file, config_);
            return page.errors;
        } catch (const ProflameException&) {
            throw;
        } catch (const std::exception& e) {
            throw ProflameException(std::string("Generation failed: ") + e.what());
        }
    }

    static void write_page(const FlamePage& page,
                           std::string_view format,
                           std::string_view out_file,
                           const FlameGraphConfig& config) {
        auto renderer = FlameGraphRendererFactory::create(format, config);
        std::ofstream ofs{std::string(out_file)};
        if (! ofs.is_open()) {
            throw OpenFileException(out_file);
        }

        renderer->render(page, ofs);

        if (! ofs.good()) {
            throw RenderException(std::string("Error writing to file: ") + std::string(out_file));
        }
    }

    void set_config(const FlameGraphConfig& config) {
        config.validate();
        config_ = config;
    }

    const FlameGraphConfig& get_config() const {
        return config_;
    }
};
} // namespace proflame
