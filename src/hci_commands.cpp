#include "ble_dtm/hci_commands.hpp"

namespace ble::dtm
{
namespace
{
std::vector<std::uint8_t> make_command(std::uint16_t opcode, const std::vector<std::uint8_t> &parameters)
{
    std::vector<std::uint8_t> packet;
    packet.reserve(4 + parameters.size());
    packet.push_back(kHciCommandPacket);
    packet.push_back(static_cast<std::uint8_t>(opcode & 0xFF));
    packet.push_back(static_cast<std::uint8_t>((opcode >> 8) & 0xFF));
    packet.push_back(static_cast<std::uint8_t>(parameters.size()));
    packet.insert(packet.end(), parameters.begin(), parameters.end());
    return packet;
}

// Bit mask for the PHY fields of HCI_LE_Set_Default_PHY.
std::uint8_t phy_mask(int phy)
{
    switch(static_cast<Phy>(phy))
    {
    case Phy::Le2M:
        return 0x02;
    case Phy::LeCodedS8:
    case Phy::LeCodedS2:
        return 0x04;
    case Phy::Le1M:
    default:
        return 0x01;
    }
}

// Receiver test PHY: both coded variants are received as "LE Coded".
std::uint8_t receiver_phy(int phy)
{
    if(phy == static_cast<int>(Phy::LeCodedS2))
    {
        return static_cast<std::uint8_t>(Phy::LeCodedS8);
    }
    return static_cast<std::uint8_t>(phy);
}

} // namespace

std::vector<std::uint8_t> encode(const ResetRequest &)
{
    return make_command(kOpcodeReset, {});
}

std::vector<std::uint8_t> encode(const SetPhyRequest &request)
{
    const std::uint8_t mask = phy_mask(request.phy);
    // ALL_PHYS = 0: both preferences are given
    return make_command(kOpcodeLeSetDefaultPhy, {0x00, mask, mask});
}

std::vector<std::uint8_t> encode(const SetTxPowerRequest &request)
{
    return make_command(kOpcodeVsSetConnTxPower,
                        {
                            static_cast<std::uint8_t>(static_cast<std::int8_t>(request.power_dbm)),
                            static_cast<std::uint8_t>(request.handle & 0xFF),
                            static_cast<std::uint8_t>((request.handle >> 8) & 0xFF),
                        });
}

std::vector<std::uint8_t> encode(const RxTestRequest &request)
{
    return make_command(kOpcodeLeReceiverTestV2,
                        {
                            static_cast<std::uint8_t>(request.channel),
                            receiver_phy(request.phy),
                            request.modulation_index,
                        });
}

std::vector<std::uint8_t> encode(const TxTestRequest &request)
{
    const auto count = static_cast<std::uint16_t>(request.packet_count);
    return make_command(kOpcodeVsTxTest,
                        {
                            static_cast<std::uint8_t>(request.channel),
                            static_cast<std::uint8_t>(request.packet_length),
                            request.payload,
                            static_cast<std::uint8_t>(request.phy),
                            static_cast<std::uint8_t>(count & 0xFF),
                            static_cast<std::uint8_t>((count >> 8) & 0xFF),
                        });
}

std::vector<std::uint8_t> encode(const EndTestRequest &)
{
    return make_command(kOpcodeLeTestEnd, {});
}

std::uint16_t command_opcode(const std::vector<std::uint8_t> &packet)
{
    if(packet.size() < 3 || packet[0] != kHciCommandPacket)
    {
        return 0;
    }
    return static_cast<std::uint16_t>(packet[1] | (packet[2] << 8));
}

std::optional<CommandComplete> parse_command_complete(const std::vector<std::uint8_t> &packet)
{
    if(packet.size() < 3 || packet[0] != kHciEventPacket)
    {
        return std::nullopt;
    }
    const std::size_t length = packet[2];
    if(packet.size() < 3 + length)
    {
        return std::nullopt;
    }

    CommandComplete complete;
    if(packet[1] == kEventCommandComplete)
    {
        // num_hci_command_packets, opcode, status
        if(length < 4)
        {
            return std::nullopt;
        }
        complete.opcode = static_cast<std::uint16_t>(packet[4] | (packet[5] << 8));
        complete.status = packet[6];
        complete.parameters.assign(packet.begin() + 7, packet.begin() + 3 + length);
        return complete;
    }
    if(packet[1] == kEventCommandStatus)
    {
        if(length < 4)
        {
            return std::nullopt;
        }
        complete.status = packet[3];
        complete.opcode = static_cast<std::uint16_t>(packet[5] | (packet[6] << 8));
        return complete;
    }
    return std::nullopt;
}

std::optional<std::uint16_t> received_packets(const CommandComplete &complete)
{
    if(complete.opcode != kOpcodeLeTestEnd || complete.status != 0 || complete.parameters.size() < 2)
    {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(complete.parameters[0] | (complete.parameters[1] << 8));
}

} // namespace ble::dtm
