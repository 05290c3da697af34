#include "ClientChannel.hpp"

namespace tabby {
namespace {
const string SEQUENCE_PLACEHOLDER = "\"seq\":0";
}

ClientChannel::ClientChannel(shared_ptr<SocketHandler> _socketHandler, int _fd,
                             int64_t _writeTimeoutMs)
    : socketHandler(_socketHandler),
      fd(_fd),
      writeTimeoutMs(_writeTimeoutMs),
      closed(false),
      broken(false) {}

bool ClientChannel::writeLocked(const Message& message) {
  if (closed || broken) {
    return false;
  }
  string line;
  try {
    line = encodeMessage(message);
  } catch (const json::exception& ex) {
    // Nothing reached the socket, so the stream is still framed
    STERROR << "Dropping unencodable " << messageTypeToString(message.type)
            << " for fd " << fd << ": " << ex.what();
    return false;
  }
  return writeLineLocked(message.type, line);
}

bool ClientChannel::writeLineLocked(MessageType type, const string& line) {
  try {
    socketHandler->writeLine(fd, line, writeTimeoutMs);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Write of " << messageTypeToString(type)
                 << " to fd " << fd << " failed: " << ex.what();
    broken = true;
    return false;
  }
  return true;
}

bool ClientChannel::send(const Message& message) {
  lock_guard<mutex> guard(writeMutex);
  return writeLocked(message);
}

ClientChannel::RenderResult ClientChannel::sendRender(
    const string& clientId, RenderPayload payload, uint64_t contentHash,
    atomic<uint64_t>* sequence) {
  lock_guard<mutex> guard(writeMutex);
  if (closed || broken) {
    return RenderResult::FAILED;
  }
  if (lastContentHash && *lastContentHash == contentHash) {
    return RenderResult::DUPLICATE;
  }
  // Encode before drawing a sequence number so a bad frame leaves no gap.
  // The stamp is spliced into a zero placeholder.
  payload.sequenceNum = 0;
  string line;
  try {
    line = encodeMessage(Message::render(clientId, payload));
  } catch (const json::exception& ex) {
    STERROR << "Dropping unencodable render for " << clientId << ": "
            << ex.what();
    return RenderResult::INVALID;
  }
  size_t seqPos = line.find(SEQUENCE_PLACEHOLDER);
  if (seqPos == string::npos) {
    STFATAL << "Render frame has no sequence field";
  }
  payload.sequenceNum = ++(*sequence);
  line.replace(seqPos, SEQUENCE_PLACEHOLDER.size(),
               "\"seq\":" + to_string(payload.sequenceNum));
  if (!writeLineLocked(MessageType::RENDER, line)) {
    return RenderResult::FAILED;
  }
  lastContentHash = contentHash;
  VLOG(2) << "Sent render seq=" << payload.sequenceNum << " to " << clientId;
  return RenderResult::SENT;
}

void ClientChannel::resetDedup() {
  lock_guard<mutex> guard(writeMutex);
  lastContentHash = nullopt;
}

void ClientChannel::close() {
  lock_guard<mutex> guard(writeMutex);
  if (closed) {
    return;
  }
  closed = true;
  socketHandler->close(fd);
}
}  // namespace tabby
