#pragma once

#include <citestream/core/types.h>

#include <spdlog/spdlog.h>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace citestream {

/**
 * @brief Owns one model handle that is built at most once.
 *
 * The factory runs under std::call_once on the first get() or warmUp(), so concurrent
 * first callers never construct the model twice. A failed load is remembered and every
 * later get() reports it as ModelUnavailable without retrying. Once loaded the model is
 * shared read-only with all consumers.
 */
template <typename T> class ModelService {
public:
    using Factory = std::function<Result<std::shared_ptr<T>>()>;

    ModelService(std::string name, Factory factory)
        : name_(std::move(name)), factory_(std::move(factory)) {}

    /// Wrap an already constructed model (tests, eager start-up)
    static std::shared_ptr<ModelService<T>> fromInstance(std::string name,
                                                         std::shared_ptr<T> instance) {
        return std::make_shared<ModelService<T>>(
            std::move(name), [instance]() -> Result<std::shared_ptr<T>> {
                if (!instance) {
                    return Error{ErrorCode::ModelUnavailable, "no model instance"};
                }
                return instance;
            });
    }

    ModelService(const ModelService&) = delete;
    ModelService& operator=(const ModelService&) = delete;

    Result<std::shared_ptr<T>> get() const {
        std::call_once(once_, [this]() { load(); });
        if (model_) {
            return model_;
        }
        return loadError_.value_or(Error{ErrorCode::ModelUnavailable, name_ + " not loaded"});
    }

    Result<void> warmUp() const {
        auto r = get();
        if (!r) {
            return r.error();
        }
        return {};
    }

    /// True once a load attempt has finished (successfully or not)
    bool attempted() const { return attempted_.load(std::memory_order_acquire); }

    const std::string& name() const { return name_; }

private:
    void load() const {
        spdlog::info("[ModelService] loading {}", name_);
        try {
            auto r = factory_ ? factory_()
                              : Result<std::shared_ptr<T>>(
                                    Error{ErrorCode::ModelUnavailable, "no factory"});
            if (r && r.value()) {
                model_ = std::move(r).value();
                spdlog::info("[ModelService] {} ready", name_);
            } else {
                loadError_ = r ? Error{ErrorCode::ModelUnavailable, name_ + " factory returned null"}
                               : Error{ErrorCode::ModelUnavailable, r.error().message};
                spdlog::error("[ModelService] failed to load {}: {}", name_, loadError_->message);
            }
        } catch (const std::exception& e) {
            loadError_ = Error{ErrorCode::ModelUnavailable, e.what()};
            spdlog::error("[ModelService] failed to load {}: {}", name_, e.what());
        }
        attempted_.store(true, std::memory_order_release);
    }

    std::string name_;
    Factory factory_;
    mutable std::once_flag once_;
    mutable std::shared_ptr<T> model_;
    mutable std::optional<Error> loadError_;
    mutable std::atomic<bool> attempted_{false};
};

} // namespace citestream
