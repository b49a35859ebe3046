#pragma once

#include <string>

extern "C"
{
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

/**
 * @brief Owns a demuxer context opened for metadata probing
 *
 * Only the container header is read; streams are never decoded.
 */
class AVFormatInputHandle
{
public:
    AVFormatInputHandle() : ctx_(nullptr) {}
    ~AVFormatInputHandle() { close(); }

    AVFormatInputHandle(const AVFormatInputHandle &) = delete;
    AVFormatInputHandle &operator=(const AVFormatInputHandle &) = delete;

    AVFormatInputHandle(AVFormatInputHandle &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }

    /**
     * @brief Open a container, replacing any context already held
     * @param file_path Container to probe
     * @param error_message Filled with the libav error text on failure
     * @return true when the header was read
     */
    bool open(const std::string &file_path, std::string &error_message)
    {
        close();
        int result = avformat_open_input(&ctx_, file_path.c_str(), nullptr, nullptr);
        if (result < 0)
        {
            char err_buf[AV_ERROR_MAX_STRING_SIZE];
            av_strerror(result, err_buf, AV_ERROR_MAX_STRING_SIZE);
            error_message = err_buf;
            ctx_ = nullptr;
            return false;
        }
        return true;
    }

    void close()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() const { return ctx_; }

private:
    AVFormatContext *ctx_;
};
