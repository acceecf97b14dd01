#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(drCore, "docretriever.core")
Q_LOGGING_CATEGORY(drIndex, "docretriever.index")
Q_LOGGING_CATEGORY(drQuery, "docretriever.query")
Q_LOGGING_CATEGORY(drRanking, "docretriever.ranking")
Q_LOGGING_CATEGORY(drEmbedding, "docretriever.embedding")
