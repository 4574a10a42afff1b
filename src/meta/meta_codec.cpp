#include "meta/meta_codec.hpp"
#include "compress/lz4.hpp"
#include "crypto/aead.hpp"
#include "crypto/crypto_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace stash::meta {

namespace {

constexpr uint8_t HEADER_MAGIC[4] = {'S', 'M', 'H', '1'};
constexpr std::size_t MAX_FIELD_NAME = 255;
constexpr std::size_t RECORD_PREFIX_SIZE = sizeof(uint32_t);

} // namespace

//==============================================
// HEADER
//==============================================

std::size_t align_field_offset(std::size_t cursor) {
  if (cursor <= HEADER_SIZE) {
    return HEADER_SIZE;
  }
  std::size_t blocks = (cursor - HEADER_SIZE + FIELD_ALIGNMENT - 1) / FIELD_ALIGNMENT;
  return HEADER_SIZE + blocks * FIELD_ALIGNMENT;
}

std::size_t MetaHeader::encoded_size() const {
  std::size_t size = sizeof(HEADER_MAGIC) + sizeof(uint32_t) + sizeof(uint8_t);
  for (const auto& field : fields) {
    size += sizeof(uint8_t) + field.name.size() + sizeof(uint32_t);
  }
  return size;
}

std::vector<uint8_t> MetaHeader::encode() const {
  if (encoded_size() > HEADER_SIZE || fields.size() > 255) {
    throw MetadataError("Meta codec: header of " + std::to_string(encoded_size()) + " bytes exceeds " +
                        std::to_string(HEADER_SIZE));
  }

  RecordWriter writer;
  writer.write_bytes(HEADER_MAGIC, sizeof(HEADER_MAGIC));
  writer.write(end);
  writer.write(static_cast<uint8_t>(fields.size()));
  for (const auto& field : fields) {
    if (field.name.empty() || field.name.size() > MAX_FIELD_NAME) {
      throw MetadataError("Meta codec: invalid field name '" + field.name + "'");
    }
    writer.write(static_cast<uint8_t>(field.name.size()));
    writer.write_bytes(reinterpret_cast<const uint8_t*>(field.name.data()), field.name.size());
    writer.write(field.offset);
  }

  std::vector<uint8_t> bytes = writer.take();
  bytes.resize(HEADER_SIZE, 0);
  return bytes;
}

MetaHeader MetaHeader::decode(const uint8_t* data, std::size_t size) {
  if (size < HEADER_SIZE) {
    throw CorruptHeader("object holds only " + std::to_string(size) + " bytes");
  }

  MetaHeader header;
  RecordReader reader(data, HEADER_SIZE);
  try {
    uint8_t magic[sizeof(HEADER_MAGIC)];
    reader.read_bytes(magic, sizeof(magic));
    if (!std::equal(magic, magic + sizeof(magic), HEADER_MAGIC)) {
      throw CorruptHeader("bad magic");
    }

    header.end = reader.read<uint32_t>();
    uint8_t count = reader.read<uint8_t>();
    header.fields.reserve(count);

    for (uint8_t i = 0; i < count; ++i) {
      FieldOffset field;
      uint8_t name_length = reader.read<uint8_t>();
      if (name_length == 0) {
        throw CorruptHeader("empty field name");
      }
      field.name.resize(name_length);
      reader.read_bytes(reinterpret_cast<uint8_t*>(&field.name[0]), name_length);
      field.offset = reader.read<uint32_t>();
      header.fields.push_back(std::move(field));
    }
  } catch (const CorruptRecord& e) {
    throw CorruptHeader(std::string("truncated: ") + e.what());
  }

  // Padding after the encoded fields must be zero
  const uint8_t* tail = data + (HEADER_SIZE - reader.remaining());
  if (std::any_of(tail, data + HEADER_SIZE, [](uint8_t b) { return b != 0; })) {
    throw CorruptHeader("non-zero header padding");
  }

  if (header.end < HEADER_SIZE || header.end > META_CAPACITY || header.end > size) {
    throw CorruptHeader("end offset " + std::to_string(header.end) + " out of range");
  }
  uint32_t previous = 0;
  for (const auto& field : header.fields) {
    if (field.offset < HEADER_SIZE || (field.offset - HEADER_SIZE) % FIELD_ALIGNMENT != 0) {
      throw CorruptHeader("misaligned offset " + std::to_string(field.offset) + " for field " + field.name);
    }
    if (field.offset >= header.end || (previous != 0 && field.offset <= previous)) {
      throw CorruptHeader("offset " + std::to_string(field.offset) + " for field " + field.name + " out of order");
    }
    previous = field.offset;
  }

  return header;
}

std::optional<uint32_t> MetaHeader::offset_of(const std::string& name) const {
  for (const auto& field : fields) {
    if (field.name == name) {
      return field.offset;
    }
  }
  return std::nullopt;
}


//==============================================
// ENCODING
//==============================================

MetaWriter::MetaWriter(store::Backend& backend, const crypto::KeyManager& keys,
                       std::optional<object::ObjectId> pinned_id)
  : backend_(backend), keys_(keys), pinned_id_(pinned_id), plaintext_(META_CAPACITY, 0) {}

void MetaWriter::write_field(const std::string& name, const std::vector<Record>& records) {
  if (finished_) {
    throw std::logic_error("MetaWriter: write_field after finish");
  }
  if (name.empty() || name.size() > MAX_FIELD_NAME) {
    throw MetadataError("Meta codec: invalid field name '" + name + "'");
  }

  std::size_t next = 0;
  for (;;) {
    std::size_t offset = header_.fields.empty() ? HEADER_SIZE : align_field_offset(header_.end);

    MetaHeader candidate = header_;
    candidate.fields.push_back({name, static_cast<uint32_t>(offset)});
    bool slot_ok = offset < META_CAPACITY
                   && candidate.encoded_size() <= HEADER_SIZE
                   && !header_.offset_of(name)
                   && compress::frame_bound(0) <= META_CAPACITY - offset;

    // Take as many whole records as the worst-case frame size allows
    std::size_t count = 0;
    std::size_t payload = 0;
    if (slot_ok) {
      std::size_t available = META_CAPACITY - offset;
      while (next + count < records.size()) {
        std::size_t framed = payload + RECORD_PREFIX_SIZE + records[next + count].size();
        if (compress::frame_bound(framed) > available) {
          break;
        }
        payload = framed;
        ++count;
      }
    }

    bool complete = next + count == records.size();
    if (!slot_ok || (count == 0 && !complete)) {
      if (header_.fields.empty()) {
        BOOST_LOG_TRIVIAL(error) << "Meta codec: Record of field " << name << " does not fit an empty object";
        throw MetadataError("Meta codec: record of field " + name + " does not fit a metadata object");
      }
      if (pinned_id_) {
        throw MetadataError("Meta codec: field " + name + " overflows pinned metadata object");
      }
      seal();
      continue;
    }

    RecordWriter stream;
    for (std::size_t i = next; i < next + count; ++i) {
      stream.write(static_cast<uint32_t>(records[i].size()));
      stream.write_bytes(records[i].data(), records[i].size());
    }
    Record payload_bytes = stream.take();
    std::vector<uint8_t> frame = compress::compress_frame(payload_bytes.data(), payload_bytes.size());

    std::fill(plaintext_.begin() + header_.end, plaintext_.begin() + offset, 0);
    std::copy(frame.begin(), frame.end(), plaintext_.begin() + offset);
    header_.fields.push_back({name, static_cast<uint32_t>(offset)});
    header_.end = static_cast<uint32_t>(offset + frame.size());

    BOOST_LOG_TRIVIAL(trace) << "Meta codec: Field " << name << " segment of " << count << " records at "
                             << offset << " (" << payload << " -> " << frame.size() << " bytes)";

    next += count;
    if (next == records.size()) {
      break;
    }
    if (pinned_id_) {
      throw MetadataError("Meta codec: field " + name + " overflows pinned metadata object");
    }
    seal();
  }
}

std::vector<object::ObjectId> MetaWriter::finish() {
  if (!finished_) {
    if (!header_.fields.empty()) {
      seal();
    }
    finished_ = true;
  }
  return written_;
}

void MetaWriter::seal() {
  object::ObjectId id = pinned_id_ ? *pinned_id_ : object::ObjectId::random();

  std::vector<uint8_t> header_bytes = header_.encode();
  std::copy(header_bytes.begin(), header_bytes.end(), plaintext_.begin());
  crypto::random_bytes(plaintext_.data() + header_.end, META_CAPACITY - header_.end);

  crypto::Nonce nonce;
  crypto::random_bytes(nonce.data(), nonce.size());

  std::vector<uint8_t> sealed(object::OBJECT_SIZE);
  crypto::Aead aead(keys_.metadata_key());
  aead.seal(nonce, plaintext_.data(), META_CAPACITY, sealed.data(),
            sealed.data() + META_CAPACITY + crypto::NONCE_SIZE);
  std::copy(nonce.begin(), nonce.end(), sealed.begin() + META_CAPACITY);

  backend_.put(id, sealed);
  written_.push_back(id);

  BOOST_LOG_TRIVIAL(debug) << "Meta codec: Stored metadata object " << id << " with "
                           << header_.fields.size() << " field segments, " << header_.end << " bytes used";
  header_ = MetaHeader();
}


//==============================================
// DECODING
//==============================================

MetaObject::MetaObject(const object::ObjectId& id, std::shared_ptr<const utils::ByteRegion> plaintext)
  : id_(id), plaintext_(std::move(plaintext)) {
  header_ = MetaHeader::decode(plaintext_->data(), plaintext_->size());
}

std::vector<Record> MetaObject::read_field(const std::string& name) const {
  std::vector<Record> records;
  auto offset = header_.offset_of(name);
  if (!offset) {
    return records;
  }

  // The frame delimits itself; the header end only bounds how far it may reach
  std::vector<uint8_t> stream;
  try {
    stream = compress::decompress_frame(plaintext_->slice(*offset, header_.end - *offset),
                                        header_.end - *offset);
  } catch (const compress::CompressionError& e) {
    BOOST_LOG_TRIVIAL(error) << "Meta codec: Field " << name << " of object " << id_ << " is damaged: " << e.what();
    throw CorruptRecord("field " + name + ": " + e.what());
  }

  RecordReader reader(stream.data(), stream.size());
  while (reader.remaining() > 0) {
    uint32_t length = reader.read<uint32_t>();
    Record record(length);
    reader.read_bytes(record.data(), length);
    records.push_back(std::move(record));
  }

  BOOST_LOG_TRIVIAL(trace) << "Meta codec: Decoded " << records.size() << " records of field " << name
                           << " from object " << id_;
  return records;
}

MetaReader::MetaReader(store::Backend& backend, const crypto::KeyManager& keys)
  : backend_(backend), keys_(keys) {}

MetaObject MetaReader::open(const object::ObjectId& id) const {
  auto region = backend_.get(id);
  if (region->size() != object::OBJECT_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Meta codec: Object " << id << " has " << region->size() << " bytes";
    throw crypto::IntegrityError("metadata object " + id.to_string() + " has invalid size");
  }

  const uint8_t* sealed = region->data();
  crypto::Nonce nonce;
  std::copy(sealed + META_CAPACITY, sealed + META_CAPACITY + crypto::NONCE_SIZE, nonce.begin());

  std::vector<uint8_t> plaintext(META_CAPACITY);
  crypto::Aead aead(keys_.metadata_key());
  try {
    aead.open(nonce, sealed, META_CAPACITY, sealed + META_CAPACITY + crypto::NONCE_SIZE, plaintext.data());
  } catch (const crypto::IntegrityError&) {
    BOOST_LOG_TRIVIAL(error) << "Meta codec: Authentication failed for metadata object " << id;
    throw crypto::IntegrityError("metadata object " + id.to_string() + " failed authentication");
  }

  BOOST_LOG_TRIVIAL(debug) << "Meta codec: Opened metadata object " << id;
  return MetaObject(id, std::make_shared<utils::MemoryRegion>(std::move(plaintext)));
}

} // namespace stash::meta
