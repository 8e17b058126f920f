#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

#include "PubSubTypes.hpp"

namespace my_pubsub {

/**
 * @brief 已交给 mosquitto、等待 on_publish 的请求（mid -> qos + 回调）
 *
 * QoS 0 的报文在写出 socket 之前断线会被 mosquitto 直接丢弃且不再回调，
 * 断线时需要由调用方取出并判失败；QoS 1/2 由 mosquitto 重连后重发。
 * 只在事件循环线程中使用，不加锁。
 */
class PublishTracker {
public:
    void Add(int mid, int qos, PublishCallback callback) {
        entries_[mid] = Entry{qos, std::move(callback)};
    }

    // 取出 mid 对应的回调；未登记（或已被判失败）时返回 false
    bool Take(int mid, PublishCallback& callback) {
        auto it = entries_.find(mid);
        if (it == entries_.end()) return false;
        callback = std::move(it->second.callback);
        entries_.erase(it);
        return true;
    }

    std::vector<PublishCallback> TakeQos0() {
        std::vector<PublishCallback> out;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.qos == 0) {
                out.push_back(std::move(it->second.callback));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        return out;
    }

    std::vector<PublishCallback> TakeAll() {
        std::vector<PublishCallback> out;
        out.reserve(entries_.size());
        for (auto& kv : entries_) out.push_back(std::move(kv.second.callback));
        entries_.clear();
        return out;
    }

    std::size_t Size() const { return entries_.size(); }

private:
    struct Entry {
        int qos{0};
        PublishCallback callback;
    };

    std::map<int, Entry> entries_;
};

} // namespace my_pubsub
