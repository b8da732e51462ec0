#include "core/attachment_types.h"

#include <gtest/gtest.h>

#include "core/ingest_error.h"
#include "core/test_util.h"

namespace dropin {
namespace {

class AttachmentTypesTest : public TempDirTest {};

TEST_F(AttachmentTypesTest, JsonOmitsBytesAndOptionalFields) {
  Attachment att;
  att.id = "att_1";
  att.filename = "a.txt";
  att.mime_type = "text/plain";
  att.size_bytes = 3;
  att.bytes = "abc";
  att.source.origin = Origin::kPaste;
  att.source.observed_at = absl::FromUnixSeconds(0);

  nlohmann::json j = att;
  EXPECT_EQ(j["id"], "att_1");
  EXPECT_EQ(j["kind"], "file");
  EXPECT_EQ(j["size"], 3);
  EXPECT_EQ(j["source"]["origin"], "paste");
  EXPECT_FALSE(j["source"].contains("original_path"));
  EXPECT_FALSE(j.contains("temp_path"));
  EXPECT_FALSE(j.contains("bytes"));
  EXPECT_FALSE(j["is_temp_file"].get<bool>());
}

TEST_F(AttachmentTypesTest, RequestPartCarriesBase64FromTempFile) {
  Attachment att;
  att.id = "att_2";
  att.filename = "pic.png";
  att.kind = AttachmentKind::kImage;
  att.temp_path = WriteFile("pic.png", "hi!");

  auto part = ToRequestPart(att);
  ASSERT_TRUE(part.ok()) << part.status();
  EXPECT_EQ((*part)["data"], "aGkh");
  EXPECT_EQ((*part)["kind"], "image");
  EXPECT_EQ((*part)["temp_path"], *att.temp_path);
}

TEST_F(AttachmentTypesTest, MissingTempFileIsIoFailure) {
  Attachment att;
  att.temp_path = Path("gone.png");
  EXPECT_TRUE(IsIngestError(LoadAttachmentBytes(att).status(), IngestErrorKind::kIoFailure));
}

TEST(AttachmentTypesNamesTest, Names) {
  EXPECT_EQ(OriginName(Origin::kFileReference), "file-reference");
  EXPECT_EQ(OriginName(Origin::kDrag), "drag");
  EXPECT_EQ(SessionStatusName(SessionStatus::kExpired), "expired");
  EXPECT_EQ(AttachmentKindName(AttachmentKind::kImage), "image");
}

}  // namespace
}  // namespace dropin
