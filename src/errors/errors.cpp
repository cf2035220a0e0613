#include "errors.hpp"

namespace jigsaw
{
    const char *toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::InvalidParameter:
            return "InvalidParameter";
        case ErrorKind::NameSpaceExhausted:
            return "NameSpaceExhausted";
        case ErrorKind::UnsupportedVersion:
            return "UnsupportedVersion";
        case ErrorKind::MalformedManifest:
            return "MalformedManifest";
        case ErrorKind::MissingFragment:
            return "MissingFragment";
        case ErrorKind::SizeMismatch:
            return "SizeMismatch";
        case ErrorKind::IntegrityMismatch:
            return "IntegrityMismatch";
        case ErrorKind::LengthMismatch:
            return "LengthMismatch";
        }
        return "Unknown";
    }

    JigsawError::JigsawError(ErrorKind kind, const std::string &message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message), kind_(kind)
    {
    }

    InvalidParameter::InvalidParameter(const std::string &parameter, const std::string &reason)
        : JigsawError(ErrorKind::InvalidParameter, parameter + " " + reason), parameter_(parameter)
    {
    }

    NameSpaceExhausted::NameSpaceExhausted(std::size_t filename_length, std::size_t fragments, const std::string &reason)
        : JigsawError(ErrorKind::NameSpaceExhausted,
                      "filenamelength " + std::to_string(filename_length) + " for " +
                          std::to_string(fragments) + " fragments: " + reason),
          filename_length_(filename_length),
          fragments_(fragments)
    {
    }

    UnsupportedVersion::UnsupportedVersion(std::int64_t version)
        : JigsawError(ErrorKind::UnsupportedVersion, "key file version " + std::to_string(version) + " is not supported"),
          version_(version)
    {
    }

    MalformedManifest::MalformedManifest(const std::string &reason)
        : JigsawError(ErrorKind::MalformedManifest, reason)
    {
    }

    FragmentError::FragmentError(ErrorKind kind, std::size_t index, const std::string &name, const std::string &message)
        : JigsawError(kind, "fragment #" + std::to_string(index) + " (" + name + ") " + message),
          index_(index),
          name_(name)
    {
    }

    MissingFragment::MissingFragment(std::size_t index, const std::string &name)
        : FragmentError(ErrorKind::MissingFragment, index, name, "not found")
    {
    }

    SizeMismatch::SizeMismatch(std::size_t index, const std::string &name, std::uint64_t expected, std::uint64_t actual)
        : FragmentError(ErrorKind::SizeMismatch, index, name,
                        "has " + std::to_string(actual) + " bytes, expected " + std::to_string(expected)),
          expected_(expected),
          actual_(actual)
    {
    }

    IntegrityMismatch::IntegrityMismatch(std::size_t index, const std::string &name, const std::string &expected, const std::string &actual)
        : FragmentError(ErrorKind::IntegrityMismatch, index, name,
                        "digest " + actual + " does not match expected " + expected),
          expected_(expected),
          actual_(actual)
    {
    }

    LengthMismatch::LengthMismatch(std::uint64_t expected, std::uint64_t actual)
        : JigsawError(ErrorKind::LengthMismatch,
                      "reconstructed " + std::to_string(actual) + " bytes, key file records " + std::to_string(expected)),
          expected_(expected),
          actual_(actual)
    {
    }
}
