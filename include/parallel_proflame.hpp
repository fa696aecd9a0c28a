#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include "proflame.hpp"

// 在 proflame.hpp 的基础上, 为同一个 profile 的每个 sample type 并行生成页面

namespace proflame {

namespace {
// sample type 名字用作文件名的一部分
inline std::string sanitize_file_component(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                    c == '_';
        out += keep ? c : '_';
    }
    return out.empty() ? std::string("series") : out;
}
} // namespace

class ParallelFlameGraphGenerator {
  private:
    FlameGraphConfig config_;

  public:
    explicit ParallelFlameGraphGenerator(const FlameGraphConfig& config = {}) : config_(config) {
        config_.validate();
    }

    // 每个任务在自己的线程上独立建树、序列化、销毁, 只共享只读的 profile
    std::vector<FlamePage> prepare_all(const Profile& profile) const {
        FlameGraphView view(profile, config_);
        std::vector<FlamePage> pages(profile.sample_types.size());

        tbb::parallel_for(tbb::blocked_range<size_t>(0, pages.size()),
                          [&view, &pages](const tbb::blocked_range<size_t>& range) {
                              for (size_t i = range.begin(); i != range.end(); ++i) {
                                  RenderRequest request;
                                  request.sample_type = std::to_string(i);
                                  pages[i] = view.prepare(request);
                              }
                          });

        return pages;
    }

    static std::string
    output_path(std::string_view out_prefix, std::string_view sample_type, std::string_view format) {
        std::string path(out_prefix);
        path += '.';
        path += sanitize_file_component(sample_type);
        path += '.';
        path += format;
        return path;
    }

    // 返回写出的文件列表, 顺序与 sample_types 一致
    std::vector<std::string>
    generate_all(std::string_view raw_file, std::string_view out_prefix, std::string_view format = "html") {
        try {
            FlameGraphGenerator loader(config_);
            Profile profile = loader.load(raw_file);

            std::vector<FlamePage> pages = prepare_all(profile);

            std::vector<std::string> written;
            written.reserve(pages.size());
            for (const auto& page : pages) {
                std::string path = output_path(out_prefix, page.sample_type, format);
                FlameGraphGenerator::write_page(page, format, path, config_);
                written.push_back(std::move(path));
            }
            return written;
        } catch (const ProflameException&) {
            throw;
        } catch (const std::exception& e) {
            throw ProflameException("Parallel generation failed: " + std::string(e.what()));
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
