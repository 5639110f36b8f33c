#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace ble::dtm
{

inline constexpr std::uint8_t kHciCommandPacket = 0x01;
inline constexpr std::uint8_t kHciEventPacket = 0x04;

inline constexpr std::uint8_t kEventCommandComplete = 0x0E;
inline constexpr std::uint8_t kEventCommandStatus = 0x0F;

inline constexpr std::uint16_t kOpcodeReset = 0x0C03;
inline constexpr std::uint16_t kOpcodeLeTestEnd = 0x201F;
inline constexpr std::uint16_t kOpcodeLeSetDefaultPhy = 0x2031;
inline constexpr std::uint16_t kOpcodeLeReceiverTestV2 = 0x2033;

// Packet counts travel as uint16 in the TX test and in LE Test End.
inline constexpr int kMaxPacketCount = 0xFFFF;

// MAX32 (Cordio link layer) vendor specific commands.
inline constexpr std::uint16_t kOpcodeVsTxTest = 0xFF03;
inline constexpr std::uint16_t kOpcodeVsSetConnTxPower = 0xFFF5;

/**
 * PHY identifiers as accepted on the command line.
 */
enum class Phy : int
{
    Le1M = 1,
    Le2M = 2,
    LeCodedS8 = 3,
    LeCodedS2 = 4,
};

struct ResetRequest
{
};

struct SetPhyRequest
{
    int phy = 1;
};

struct SetTxPowerRequest
{
    int power_dbm = 0;
    std::uint16_t handle = 0;
};

struct RxTestRequest
{
    int channel = 0;
    int phy = 1;
    std::uint8_t modulation_index = 0;
};

/**
 * Vendor specific transmitter test. Unlike HCI_LE_Transmitter_Test the device
 * stops on its own once @c packet_count packets have been sent.
 */
struct TxTestRequest
{
    int channel = 0;
    int phy = 1;
    int packet_length = 250;
    int packet_count = 5000;
    std::uint8_t payload = 0;
};

struct EndTestRequest
{
};

struct CommandComplete
{
    std::uint16_t opcode = 0;
    std::uint8_t status = 0;
    // Return parameters following the status byte.
    std::vector<std::uint8_t> parameters;
};

std::vector<std::uint8_t> encode(const ResetRequest &request);
std::vector<std::uint8_t> encode(const SetPhyRequest &request);
std::vector<std::uint8_t> encode(const SetTxPowerRequest &request);
std::vector<std::uint8_t> encode(const RxTestRequest &request);
std::vector<std::uint8_t> encode(const TxTestRequest &request);
std::vector<std::uint8_t> encode(const EndTestRequest &request);

std::uint16_t command_opcode(const std::vector<std::uint8_t> &packet);

/**
 * Decode an H4 event packet (type byte included). Command Status events are
 * reported with an empty parameter list.
 *
 * @return the decoded completion, or std::nullopt when the packet is not a
 *         complete Command Complete / Command Status event.
 */
std::optional<CommandComplete> parse_command_complete(const std::vector<std::uint8_t> &packet);

/**
 * Number of packets reported by an HCI_LE_Test_End completion.
 */
std::optional<std::uint16_t> received_packets(const CommandComplete &complete);

} // namespace ble::dtm
