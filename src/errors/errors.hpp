#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace jigsaw
{
    enum class ErrorKind
    {
        InvalidParameter,
        NameSpaceExhausted,
        UnsupportedVersion,
        MalformedManifest,
        MissingFragment,
        SizeMismatch,
        IntegrityMismatch,
        LengthMismatch
    };

    const char *toString(ErrorKind kind);

    // Base of every failure raised by the slicing/assembly engine.
    class JigsawError : public std::runtime_error
    {
    public:
        JigsawError(ErrorKind kind, const std::string &message);

        ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    class InvalidParameter : public JigsawError
    {
    public:
        InvalidParameter(const std::string &parameter, const std::string &reason);

        const std::string &parameter() const noexcept { return parameter_; }

    private:
        std::string parameter_;
    };

    class NameSpaceExhausted : public JigsawError
    {
    public:
        NameSpaceExhausted(std::size_t filename_length, std::size_t fragments, const std::string &reason);

        std::size_t filenameLength() const noexcept { return filename_length_; }
        std::size_t fragments() const noexcept { return fragments_; }

    private:
        std::size_t filename_length_;
        std::size_t fragments_;
    };

    class UnsupportedVersion : public JigsawError
    {
    public:
        explicit UnsupportedVersion(std::int64_t version);

        std::int64_t version() const noexcept { return version_; }

    private:
        std::int64_t version_;
    };

    class MalformedManifest : public JigsawError
    {
    public:
        explicit MalformedManifest(const std::string &reason);
    };

    // Fragment-level failures all name the fragment they are about.
    class FragmentError : public JigsawError
    {
    public:
        FragmentError(ErrorKind kind, std::size_t index, const std::string &name, const std::string &message);

        std::size_t index() const noexcept { return index_; }
        const std::string &name() const noexcept { return name_; }

    private:
        std::size_t index_;
        std::string name_;
    };

    class MissingFragment : public FragmentError
    {
    public:
        MissingFragment(std::size_t index, const std::string &name);
    };

    class SizeMismatch : public FragmentError
    {
    public:
        SizeMismatch(std::size_t index, const std::string &name, std::uint64_t expected, std::uint64_t actual);

        std::uint64_t expected() const noexcept { return expected_; }
        std::uint64_t actual() const noexcept { return actual_; }

    private:
        std::uint64_t expected_;
        std::uint64_t actual_;
    };

    class IntegrityMismatch : public FragmentError
    {
    public:
        IntegrityMismatch(std::size_t index, const std::string &name, const std::string &expected, const std::string &actual);

        const std::string &expected() const noexcept { return expected_; }
        const std::string &actual() const noexcept { return actual_; }

    private:
        std::string expected_;
        std::string actual_;
    };

    class LengthMismatch : public JigsawError
    {
    public:
        LengthMismatch(std::uint64_t expected, std::uint64_t actual);

        std::uint64_t expected() const noexcept { return expected_; }
        std::uint64_t actual() const noexcept { return actual_; }

    private:
        std::uint64_t expected_;
        std::uint64_t actual_;
    };
}
