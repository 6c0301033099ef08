/**
 * @file main.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief mcrw - MIFARE Classic reader/writer for PC/SC readers
 * @version 0.1
 * @date 2026-10-16
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

#include "Pcsc/PcscReader.h"
#include "Mcrw/Card/CardManager.h"
#include "Mcrw/Classic/PcscCommandSet.h"
#include "Utils/Logging.h"

using namespace mcrw;
using namespace pcsc;
using namespace error;

namespace
{
    void printUsage()
    {
        std::cout << "Usage:"
                  << "\n\tmcrw a|b key action block|sector data|value"
                  << "\n\techo $data | mcrw a|b key action block|sector\n"
                  << std::endl;

        std::cout << "Actions:"
                  << "\n\tread-block block"
                  << "\n\tread-block-string block"
                  << "\n\twrite-block block data"
                  << "\n\twrite-block-string block data"
                  << "\n\tclear-block block"
                  << "\n"
                  << "\n\tformat-value-block block"
                  << "\n\tread-value-block block"
                  << "\n\tincrement-value-block block value"
                  << "\n\tdecrement-value-block block value"
                  << "\n"
                  << "\n\tread-sector sector"
                  << "\n\tread-sector-string sector"
                  << "\n\tread-sector-info sector"
                  << "\n\twrite-sector sector data"
                  << "\n\twrite-sector-string sector data"
                  << "\n\tclear-sector sector"
                  << "\n"
                  << "\n\tread-sector-trailer sector"
                  << "\n\twrite-sector-trailer sector data"
                  << "\n"
                  << "\n\tread-card-info\n"
                  << std::endl;

        std::cout << "Examples:"
                  << "\n\tmcrw a 08429a71b536 write-block 4 4578616d706c6520537472696e670000"
                  << "\n\tmcrw b 05c4f163e7d2 write-block-string 5 \"Example String\""
                  << "\n\tmcrw b 05c4f163e7d2 increment-value-block 6 10"
                  << std::endl;
    }

    /**
     * @brief Apply MCRW_LOG_LEVEL (debug, info, warn, error, off)
     */
    void configureLogging()
    {
        const char* level = std::getenv("MCRW_LOG_LEVEL");
        if (level == nullptr)
        {
            return;
        }

        const std::string name = level;
        if (name == "debug")
        {
            Logger::setLevel(Logger::Level::Debug);
        }
        else if (name == "info")
        {
            Logger::setLevel(Logger::Level::Info);
        }
        else if (name == "warn")
        {
            Logger::setLevel(Logger::Level::Warn);
        }
        else if (name == "error")
        {
            Logger::setLevel(Logger::Level::Error);
        }
        else if (name == "off")
        {
            Logger::setLevel(Logger::Level::Off);
        }
    }

    int fail(const std::string& message)
    {
        std::cerr << "Error: " << message << std::endl;
        return EXIT_FAILURE;
    }

    int fail(const Error& err)
    {
        return fail(std::string(err.message().c_str()));
    }

    bool parseNumber(int argc, char* argv[], int index, long& value)
    {
        if (index >= argc)
        {
            return false;
        }

        errno = 0;
        char* end = nullptr;
        value = std::strtol(argv[index], &end, 10);
        return errno == 0 && end != argv[index] && *end == '\0';
    }

    /**
     * @brief Data argument, or standard input with line breaks removed
     */
    std::string readData(int argc, char* argv[])
    {
        if (argc > 4)
        {
            return argv[4];
        }

        std::string data((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        std::string stripped;
        for (char c : data)
        {
            if (c != '\n' && c != '\r')
            {
                stripped.push_back(c);
            }
        }
        return stripped;
    }

    etl::string_view view(const std::string& text)
    {
        return etl::string_view(text.data(), text.size());
    }

    template<typename T>
    int printResult(const etl::expected<T, Error>& result)
    {
        if (!result)
        {
            return fail(result.error());
        }
        std::cout << result.value().c_str() << std::endl;
        return EXIT_SUCCESS;
    }

    int checkResult(const etl::expected<void, Error>& result)
    {
        if (!result)
        {
            return fail(result.error());
        }
        return EXIT_SUCCESS;
    }

    int runAction(MifareClassicCard& card, etl::string_view readerName, const std::string& action, int argc, char* argv[])
    {
        if (action == "read-card-info")
        {
            std::cout << card.readCardInfo(readerName);
            return EXIT_SUCCESS;
        }

        long index = 0;
        if (!parseNumber(argc, argv, 3, index) || index < 0 || index > 0xFFFF)
        {
            return fail(argc > 3 ? std::string("Invalid Number: ") + argv[3] : std::string("Missing Argument."));
        }
        const uint16_t target = static_cast<uint16_t>(index);

        if (action == "read-block")
        {
            return printResult(card.readBlockHexString(target));
        }
        if (action == "read-block-string")
        {
            return printResult(card.readBlockString(target));
        }
        if (action == "write-block")
        {
            return checkResult(card.writeBlockHexString(target, view(readData(argc, argv))));
        }
        if (action == "write-block-string")
        {
            return checkResult(card.writeBlockString(target, view(readData(argc, argv))));
        }
        if (action == "clear-block")
        {
            return checkResult(card.clearBlock(target));
        }
        if (action == "format-value-block")
        {
            return checkResult(card.formatValueBlock(target));
        }
        if (action == "read-value-block")
        {
            auto value = card.readValueBlock(target);
            if (!value)
            {
                return fail(value.error());
            }
            std::cout << value.value() << std::endl;
            return EXIT_SUCCESS;
        }
        if (action == "increment-value-block" || action == "decrement-value-block")
        {
            long amount = 0;
            if (!parseNumber(argc, argv, 4, amount) || amount < INT32_MIN || amount > INT32_MAX)
            {
                return fail(argc > 4 ? std::string("Invalid Number: ") + argv[4] : std::string("Missing Argument."));
            }

            if (action == "increment-value-block")
            {
                return checkResult(card.incrementValueBlock(target, static_cast<int32_t>(amount)));
            }
            return checkResult(card.decrementValueBlock(target, static_cast<int32_t>(amount)));
        }
        if (action == "read-sector")
        {
            return printResult(card.readSectorHexString(target));
        }
        if (action == "read-sector-string")
        {
            return printResult(card.readSectorString(target));
        }
        if (action == "read-sector-info")
        {
            std::cout << card.readSectorInfo(target);
            return EXIT_SUCCESS;
        }
        if (action == "write-sector")
        {
            return checkResult(card.writeSectorHexString(target, view(readData(argc, argv))));
        }
        if (action == "write-sector-string")
        {
            return checkResult(card.writeSectorString(target, view(readData(argc, argv))));
        }
        if (action == "clear-sector")
        {
            return checkResult(card.clearSector(target));
        }
        if (action == "read-sector-trailer")
        {
            return printResult(card.readSectorTrailerHexString(target));
        }
        if (action == "write-sector-trailer")
        {
            return checkResult(card.writeSectorTrailerHexString(target, view(readData(argc, argv))));
        }

        return fail("Invalid Action: " + action);
    }
}

int main(int argc, char* argv[])
{
    configureLogging();

    if (argc < 2)
    {
        printUsage();
        return EXIT_SUCCESS;
    }

    const std::string keySlot = argv[1];
    KeyType keyType;
    if (keySlot == "a")
    {
        keyType = KeyType::A;
    }
    else if (keySlot == "b")
    {
        keyType = KeyType::B;
    }
    else
    {
        return fail("Invalid Key: " + keySlot);
    }

    if (argc < 4)
    {
        return fail("Missing Argument.");
    }

    const std::string key = argv[2];
    if (key.size() != buffer::KEY_HEX_SIZE)
    {
        return fail("Invalid Key Length: " + std::to_string(key.size()));
    }

    PcscReader reader;
    auto ready = reader.init();
    if (!ready)
    {
        return fail(ready.error());
    }

    PcscCommandSet commandSet;
    CardManager cardManager(reader, reader, commandSet);

    auto session = cardManager.createSession();
    if (!session)
    {
        return fail(session.error());
    }

    MifareClassicCard& card = session.value()->getMifareClassicCard();

    int status = checkResult(card.loadKey(keyType, view(key)));
    if (status == EXIT_SUCCESS)
    {
        status = runAction(card, reader.getReaderName(), argv[3], argc - 1, argv + 1);
    }

    auto released = cardManager.clearSession();
    if (!released && status == EXIT_SUCCESS)
    {
        status = fail(released.error());
    }

    return status;
}
