#include "core/content_hasher.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

std::string Fingerprint::key() const
{
    return DuplicateStrategies::getName(strategy) + ":" + digest;
}

HashResult ContentHasher::fingerprint(const std::string &file_path, DuplicateStrategy strategy, size_t chunk_size)
{
    switch (strategy)
    {
    case DuplicateStrategy::EXACT:
        return computeExactHash(file_path, chunk_size);
    case DuplicateStrategy::PERCEPTUAL:
        return computePerceptualHash(file_path);
    default:
        return HashResult(ErrorKind::UNSUPPORTED_CONTENT, "Unknown duplicate strategy for: " + file_path);
    }
}

HashResult ContentHasher::computeExactHash(const std::string &file_path, size_t chunk_size)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    if (chunk_size == 0)
    {
        chunk_size = DEFAULT_CHUNK_SIZE;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        return HashResult(ErrorKind::IO_FAILURE, "Could not open file: " + file_path);
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
    {
        return HashResult(ErrorKind::IO_FAILURE, "SHA256_Init failed for: " + file_path);
    }

    std::vector<char> buffer(chunk_size);
    while (file.good())
    {
        file.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(bytes_read)) != 1)
            {
                return HashResult(ErrorKind::IO_FAILURE, "SHA256_Update failed for: " + file_path);
            }
        }
    }
    if (file.bad())
    {
        return HashResult(ErrorKind::IO_FAILURE, "Read error while hashing: " + file_path);
    }
    if (SHA256_Final(hash, &sha256) != 1)
    {
        return HashResult(ErrorKind::IO_FAILURE, "SHA256_Final failed for: " + file_path);
    }

    std::vector<uint8_t> digest(hash, hash + SHA256_DIGEST_LENGTH);
    return HashResult(Fingerprint(DuplicateStrategy::EXACT, toHex(digest)));
}

HashResult ContentHasher::computePerceptualHash(const std::string &file_path)
{
    // Any extension OpenCV can decode is accepted; video containers never are
    if (FileUtils::isVideoFile(file_path))
    {
        return HashResult(ErrorKind::UNSUPPORTED_CONTENT, "Perceptual hash requires an image: " + file_path);
    }

    std::ifstream probe(file_path, std::ios::binary);
    if (!probe.is_open())
    {
        return HashResult(ErrorKind::IO_FAILURE, "Could not open file: " + file_path);
    }
    probe.close();

    try
    {
        cv::Mat image = cv::imread(file_path, cv::IMREAD_COLOR);
        if (image.empty())
        {
            return HashResult(ErrorKind::UNSUPPORTED_CONTENT, "Failed to decode image: " + file_path);
        }

        Logger::debug("Image loaded for pHash: " + file_path + " (size: " + std::to_string(image.cols) + "x" + std::to_string(image.rows) + ")");

        std::vector<uint8_t> phash = generatePHash(image);
        return HashResult(Fingerprint(DuplicateStrategy::PERCEPTUAL, toHex(phash)));
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during perceptual hashing: " + std::string(e.what()));
        return HashResult(ErrorKind::UNSUPPORTED_CONTENT, "OpenCV processing error: " + std::string(e.what()));
    }
}

std::vector<uint8_t> ContentHasher::generatePHash(const cv::Mat &image)
{
    cv::Mat gray_image;
    if (image.channels() == 1)
        gray_image = image;
    else if (image.channels() == 4)
        cv::cvtColor(image, gray_image, cv::COLOR_BGRA2GRAY);
    else
        cv::cvtColor(image, gray_image, cv::COLOR_BGR2GRAY);

    // 32x32 keeps only the coarse structure
    cv::Mat resized_image;
    cv::resize(gray_image, resized_image, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

    cv::Mat float_image;
    resized_image.convertTo(float_image, CV_32F);

    cv::Mat dct_image;
    cv::dct(float_image, dct_image);

    // Top-left 8x8 holds the low frequencies
    cv::Mat dct_8x8 = dct_image(cv::Rect(0, 0, 8, 8));

    std::vector<float> dct_values;
    for (int y = 0; y < 8; y++)
    {
        for (int x = 0; x < 8; x++)
        {
            if (x == 0 && y == 0)
                continue; // DC component
            dct_values.push_back(dct_8x8.at<float>(y, x));
        }
    }

    std::vector<float> sorted_values = dct_values;
    std::sort(sorted_values.begin(), sorted_values.end());
    float median = sorted_values[sorted_values.size() / 2];

    std::vector<uint8_t> phash_data(8, 0);
    int hash_index = 0;
    int bit_position = 0;
    for (float dct_value : dct_values)
    {
        if (dct_value > median)
        {
            phash_data[hash_index] |= static_cast<uint8_t>(1 << (7 - bit_position));
        }

        bit_position++;
        if (bit_position == 8)
        {
            bit_position = 0;
            hash_index++;
        }
    }
    return phash_data;
}

std::string ContentHasher::toHex(const std::vector<uint8_t> &data)
{
    std::stringstream ss;
    for (uint8_t byte : data)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    return ss.str();
}
