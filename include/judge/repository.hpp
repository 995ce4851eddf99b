#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace labjudge {

/**
 * @brief 提交的持久化存储
 * 评测器在开始评测和评测结束时都会调用 save，实现必须是线程安全的。
 */
struct submission_repository {
    virtual ~submission_repository();

    /**
     * @brief 保存提交的当前状态，覆盖之前保存的状态
     * @param snapshot 提交的副本
     */
    virtual void save(const submission &snapshot) = 0;

    /**
     * @brief 读取保存的提交
     */
    virtual std::optional<submission> load(const std::string &id) = 0;
};

/**
 * @brief 将每个提交保存为 <dir>/<id>.json
 * 写入时先写临时文件再重命名，读者不会读到写了一半的文件
 */
struct json_file_repository : public submission_repository {
    explicit json_file_repository(const std::filesystem::path &dir);

    void save(const submission &snapshot) override;

    std::optional<submission> load(const std::string &id) override;

    std::filesystem::path path_of(const std::string &id) const;

private:
    std::filesystem::path dir;
};

/**
 * @brief 保存在内存中的提交，记录每次保存的状态
 */
struct memory_repository : public submission_repository {
    void save(const submission &snapshot) override;

    std::optional<submission> load(const std::string &id) override;

    /**
     * @brief 提交每次保存时的状态，按保存顺序排列
     */
    std::vector<status> history(const std::string &id);

private:
    std::mutex mut;
    std::map<std::string, submission> submissions;
    std::map<std::string, std::vector<status>> histories;
};

}  // namespace labjudge
