#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace labjudge {

/**
 * @brief 可关闭的并发队列，多个写者多个读者
 * 关闭后不能再加入新元素，读者取完剩余元素后退出
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已经关闭时返回 false，元素不会被加入
     */
    bool push(const T &value) {
        {
            std::scoped_lock lock(mut);
            if (is_closed) return false;
            q.push(value);
        }
        cond.notify_one();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，队列为空时阻塞，直到有新元素或者队列被关闭
     * @return 队列已关闭且为空时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> lock(mut);
        cond.wait(lock, [this] { return !q.empty() || is_closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者
     */
    void close() {
        {
            std::scoped_lock lock(mut);
            is_closed = true;
        }
        cond.notify_all();
    }

    bool closed() {
        std::scoped_lock lock(mut);
        return is_closed;
    }

    size_t size() {
        std::scoped_lock lock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    bool is_closed = false;
};

}  // namespace labjudge
