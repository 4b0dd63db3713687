#include "tasklex/nlp/language.hpp"

#include <cctype>
#include <map>

namespace tasklex::nlp {

namespace {

LanguageProfile makeEnglish() {
  LanguageProfile p;
  p.code = "en";
  p.name = "English";

  p.cues.due = {"due on", "due by", "due", "deadline", "must be done by", "by"};
  p.cues.scheduled = {"scheduled for", "scheduled on", "scheduled", "start on", "begin on",
                      "work on", "on"};
  p.cues.range_start = {"from", "between"};
  p.cues.range_end = {"to", "until", "till", "through", "and"};

  p.weekdays = {{{"monday"}, {"tuesday"}, {"wednesday"}, {"thursday"}, {"friday"},
                 {"saturday"}, {"sunday"}}};

  auto& d = p.dates;
  d.relative_days = {{"today", 0}, {"tonight", 0}, {"tomorrow", 1}, {"yesterday", -1},
                     {"day after tomorrow", 2}, {"the day after tomorrow", 2},
                     {"day before yesterday", -2}};
  d.now = {"now", "right now"};
  d.next = {"next"};
  d.in = {"in"};
  d.at = {"at"};
  d.noon = {"noon", "midday"};
  d.midnight = {"midnight"};
  d.am = {"am", "a.m."};
  d.pm = {"pm", "p.m."};
  d.months = {{{"january", "jan"}, {"february", "feb"}, {"march", "mar"}, {"april", "apr"},
               {"may"}, {"june", "jun"}, {"july", "jul"}, {"august", "aug"},
               {"september", "sept", "sep"}, {"october", "oct"}, {"november", "nov"},
               {"december", "dec"}}};
  d.ordinal_suffixes = {"st", "nd", "rd", "th"};
  d.day_month_connectors = {"of"};
  d.month_first_numeric = true;

  auto& r = p.recurrence;
  r.frequencies = {{{"daily", "every day"}, {"weekly", "every week"},
                    {"monthly", "every month"}, {"yearly", "annually", "every year"}}};
  r.every = {"every"};
  r.other = {"other"};
  r.plural_weekdays = {{{"mondays"}, {"tuesdays"}, {"wednesdays"}, {"thursdays"}, {"fridays"},
                        {"saturdays"}, {"sundays"}}};
  r.ordinals = {{{"first"}, {"second"}, {"third"}, {"fourth"}, {"last"}}};
  r.periods = {{{"day", "days"}, {"week", "weeks"}, {"month", "months"}, {"year", "years"}}};

  p.estimate.hours = {"h", "hr", "hrs", "hour", "hours"};
  p.estimate.minutes = {"m", "min", "mins", "minute", "minutes"};

  p.fallback_statuses = {
    {"open", false, {"todo", "to do", "open"}},
    {"in-progress", false, {"in progress", "in-progress", "doing"}},
    {"done", true, {"done", "completed", "finished"}},
    {"cancelled", true, {"cancelled", "canceled"}},
    {"waiting", false, {"waiting", "blocked", "on hold"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"urgent", "critical", "highest"}},
    {"high", false, {"high", "important"}},
    {"normal", false, {"medium", "normal"}},
    {"low", false, {"low", "minor"}},
  };
  return p;
}

LanguageProfile makeGerman() {
  LanguageProfile p;
  p.code = "de";
  p.name = "Deutsch";

  p.cues.due = {"fällig am", "fällig bis", "fällig", "termin", "abgabe", "deadline", "bis zum",
                "bis"};
  p.cues.scheduled = {"geplant für", "geplant am", "beginnen am", "anfangen am", "arbeiten an",
                      "am"};
  p.cues.range_start = {"von", "vom", "ab"};
  p.cues.range_end = {"bis", "bis zum", "bis zur"};

  p.weekdays = {{{"montag"}, {"dienstag"}, {"mittwoch"}, {"donnerstag"}, {"freitag"},
                 {"samstag", "sonnabend"}, {"sonntag"}}};

  auto& d = p.dates;
  d.relative_days = {{"heute", 0}, {"morgen", 1}, {"gestern", -1}, {"übermorgen", 2},
                     {"vorgestern", -2}};
  d.now = {"jetzt"};
  d.next = {"nächste", "nächsten", "nächster", "nächstes", "kommende", "kommenden"};
  d.in = {"in"};
  d.at = {"um"};
  d.noon = {"mittag"};
  d.midnight = {"mitternacht"};
  d.hour_suffix = {"uhr"};
  d.months = {{{"januar", "jan"}, {"februar", "feb"}, {"märz", "mär"}, {"april", "apr"},
               {"mai"}, {"juni", "jun"}, {"juli", "jul"}, {"august", "aug"},
               {"september", "sept", "sep"}, {"oktober", "okt"}, {"november", "nov"},
               {"dezember", "dez"}}};
  d.ordinal_suffixes = {"."};

  auto& r = p.recurrence;
  r.frequencies = {{{"täglich", "jeden Tag", "alle Tage", "tagaus tagein"},
                    {"wöchentlich", "jede Woche", "alle Wochen"},
                    {"monatlich", "jeden Monat", "alle Monate"},
                    {"jährlich", "jedes Jahr", "alle Jahre"}}};
  r.every = {"jede", "jeden", "jedes", "alle"};
  r.other = {"andere", "anderen", "anderes"};
  r.plural_weekdays = {{{"montags"}, {"dienstags"}, {"mittwochs"}, {"donnerstags"},
                        {"freitags"}, {"samstags"}, {"sonntags"}}};
  r.ordinals = {{{"erste", "ersten", "erster"}, {"zweite", "zweiten", "zweiter"},
                 {"dritte", "dritten", "dritter"}, {"vierte", "vierten", "vierter"},
                 {"letzte", "letzten", "letzter"}}};
  r.periods = {{{"tag", "tage", "tagen"}, {"woche", "wochen"}, {"monat", "monate", "monaten"},
                {"jahr", "jahre", "jahren"}}};

  p.estimate.hours = {"h", "std", "stunde", "stunden"};
  p.estimate.minutes = {"m", "min", "minute", "minuten"};

  p.fallback_statuses = {
    {"open", false, {"offen", "zu erledigen", "ausstehend", "todo"}},
    {"in-progress", false, {"in bearbeitung", "wird bearbeitet", "läuft", "in arbeit"}},
    {"done", true, {"erledigt", "fertig", "abgeschlossen", "gemacht"}},
    {"cancelled", true, {"abgebrochen", "storniert", "abgesagt"}},
    {"waiting", false, {"wartend", "warten", "blockiert", "pausiert"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"dringend", "eilig", "kritisch", "sofort", "höchste"}},
    {"high", false, {"hoch", "hohe", "wichtig", "prioritär"}},
    {"normal", false, {"normal", "mittel", "mittlere", "standard"}},
    {"low", false, {"niedrig", "niedrige", "gering", "geringe"}},
  };
  return p;
}

LanguageProfile makeSpanish() {
  LanguageProfile p;
  p.code = "es";
  p.name = "Español";

  p.cues.due = {"vence el", "vence", "fecha límite", "debe terminarse", "para el", "antes del"};
  p.cues.scheduled = {"programado para", "programado el", "comenzar el", "empezar el",
                      "trabajar en", "el"};
  p.cues.range_start = {"desde", "desde el", "del", "de"};
  p.cues.range_end = {"hasta", "hasta el", "al", "a"};

  p.weekdays = {{{"lunes"}, {"martes"}, {"miércoles", "miercoles"}, {"jueves"}, {"viernes"},
                 {"sábado", "sabado"}, {"domingo"}}};

  auto& d = p.dates;
  d.relative_days = {{"hoy", 0}, {"mañana", 1}, {"ayer", -1}, {"pasado mañana", 2},
                     {"anteayer", -2}};
  d.now = {"ahora", "ahora mismo"};
  d.next = {"próximo", "próxima"};
  d.next_after = {"que viene", "próximo", "próxima"};
  d.in = {"en", "dentro de"};
  d.at = {"a las", "a la"};
  d.noon = {"mediodía"};
  d.midnight = {"medianoche"};
  d.months = {{{"enero"}, {"febrero"}, {"marzo"}, {"abril"}, {"mayo"}, {"junio"}, {"julio"},
               {"agosto"}, {"septiembre", "setiembre"}, {"octubre"}, {"noviembre"},
               {"diciembre"}}};
  d.ordinal_suffixes = {"º", "°"};
  d.day_month_connectors = {"de"};

  auto& r = p.recurrence;
  r.frequencies = {{{"diario", "diaria", "diariamente", "cada día", "todos los días", "a diario"},
                    {"semanal", "semanalmente", "cada semana", "todas las semanas", "por semana"},
                    {"mensual", "mensualmente", "cada mes", "todos los meses", "por mes"},
                    {"anual", "anualmente", "cada año", "todos los años", "por año"}}};
  r.every = {"cada", "todos los", "todas las"};
  r.other = {"otro", "otra"};
  // Weekdays ending in -s have no distinct plural
  r.plural_weekdays = {{{}, {}, {}, {}, {}, {"sábados", "sabados"}, {"domingos"}}};
  r.ordinals = {{{"primer", "primera", "primero"}, {"segundo", "segunda"},
                 {"tercer", "tercera", "tercero"}, {"cuarto", "cuarta"},
                 {"último", "última"}}};
  r.periods = {{{"día", "días"}, {"semana", "semanas"}, {"mes", "meses"}, {"año", "años"}}};

  p.estimate.hours = {"h", "hr", "hrs", "hora", "horas"};
  p.estimate.minutes = {"m", "min", "mins", "minuto", "minutos"};

  p.fallback_statuses = {
    {"open", false, {"pendiente", "por hacer", "abierto", "todo"}},
    {"in-progress", false, {"en progreso", "en curso", "haciendo", "trabajando"}},
    {"done", true, {"hecho", "terminado", "completado", "finalizado"}},
    {"cancelled", true, {"cancelado", "anulado"}},
    {"waiting", false, {"esperando", "bloqueado", "en espera"}},
  };
  p.fallback_priorities = {
    {"urgent", false,
     {"urgente", "crítico", "crítica", "máximo", "máxima", "prioritario", "prioritaria"}},
    {"high", false, {"alto", "alta", "importante", "elevado", "elevada"}},
    {"normal", false, {"medio", "media", "normal", "regular", "estándar"}},
    {"low", false, {"bajo", "baja", "menor", "mínimo", "mínima"}},
  };
  return p;
}

LanguageProfile makeFrench() {
  LanguageProfile p;
  p.code = "fr";
  p.name = "Français";

  p.cues.due = {"échéance", "date limite", "doit être terminé", "pour le", "avant le"};
  p.cues.scheduled = {"programmé pour", "programmé le", "commencer le", "débuter le",
                      "travailler sur", "le"};
  p.cues.range_start = {"du", "de", "depuis", "à partir de"};
  p.cues.range_end = {"au", "à", "jusqu'à", "jusqu'au", "jusqu’à", "jusqu’au"};

  p.weekdays = {{{"lundi"}, {"mardi"}, {"mercredi"}, {"jeudi"}, {"vendredi"}, {"samedi"},
                 {"dimanche"}}};

  auto& d = p.dates;
  d.relative_days = {{"aujourd'hui", 0}, {"aujourd’hui", 0}, {"demain", 1}, {"hier", -1},
                     {"après-demain", 2}, {"avant-hier", -2}};
  d.now = {"maintenant"};
  d.next = {"prochain", "prochaine"};
  d.next_after = {"prochain", "prochaine"};
  d.in = {"dans"};
  d.at = {"à"};
  d.noon = {"midi"};
  d.midnight = {"minuit"};
  d.months = {{{"janvier", "janv"}, {"février", "févr"}, {"mars"}, {"avril", "avr"}, {"mai"},
               {"juin"}, {"juillet", "juil"}, {"août"}, {"septembre", "sept"},
               {"octobre", "oct"}, {"novembre", "nov"}, {"décembre", "déc"}}};
  d.ordinal_suffixes = {"er"};

  auto& r = p.recurrence;
  r.frequencies = {{{"quotidien", "quotidienne", "quotidiennement", "chaque jour",
                     "tous les jours", "journalier", "journalière"},
                    {"hebdomadaire", "chaque semaine", "toutes les semaines", "par semaine"},
                    {"mensuel", "mensuelle", "mensuellement", "chaque mois", "tous les mois",
                     "par mois"},
                    {"annuel", "annuelle", "annuellement", "chaque année", "tous les ans",
                     "par an", "par année"}}};
  r.every = {"chaque", "tous les", "toutes les"};
  r.other = {"autre"};
  r.ordinals = {{{"premier", "première"}, {"deuxième", "second", "seconde"}, {"troisième"},
                 {"quatrième"}, {"dernier", "dernière"}}};
  r.periods = {{{"jour", "jours"}, {"semaine", "semaines"}, {"mois"},
                {"an", "ans", "année", "années"}}};

  p.estimate.hours = {"h", "hr", "hrs", "heure", "heures"};
  p.estimate.minutes = {"m", "min", "mins", "minute", "minutes"};

  p.fallback_statuses = {
    {"open", false, {"à faire", "ouvert", "todo"}},
    {"in-progress", false, {"en cours", "en progression", "en train de faire"}},
    {"done", true, {"terminé", "fini", "accompli", "fait"}},
    {"cancelled", true, {"annulé", "abandonné"}},
    {"waiting", false, {"en attente", "bloqué", "suspendu"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"urgent", "urgente", "critique", "maximum", "prioritaire"}},
    {"high", false,
     {"élevé", "élevée", "haut", "haute", "important", "importante", "supérieur",
      "supérieure"}},
    {"normal", false,
     {"moyen", "moyenne", "normal", "normale", "standard", "régulier", "régulière"}},
    {"low", false, {"faible", "bas", "basse", "mineur", "mineure", "minimum"}},
  };
  return p;
}

LanguageProfile makeItalian() {
  LanguageProfile p;
  p.code = "it";
  p.name = "Italiano";

  p.cues.due = {"scadenza", "entro", "entro il", "deve essere fatto entro", "per il", "termine"};
  p.cues.scheduled = {"programmato per", "programmato il", "iniziare il", "lavorare su", "il",
                      "per"};
  p.cues.range_start = {"da", "dal", "dalla"};
  p.cues.range_end = {"a", "al", "alla", "fino a", "fino al"};

  p.weekdays = {{{"lunedì", "lunedi"}, {"martedì", "martedi"}, {"mercoledì", "mercoledi"},
                 {"giovedì", "giovedi"}, {"venerdì", "venerdi"}, {"sabato"}, {"domenica"}}};

  auto& d = p.dates;
  d.relative_days = {{"oggi", 0}, {"stasera", 0}, {"domani", 1}, {"ieri", -1},
                     {"dopodomani", 2}, {"altro ieri", -2}, {"l'altro ieri", -2}};
  d.now = {"adesso"};
  d.next = {"prossimo", "prossima"};
  d.next_after = {"prossimo", "prossima"};
  d.in = {"tra", "fra"};
  d.at = {"alle", "alle ore"};
  d.noon = {"mezzogiorno"};
  d.midnight = {"mezzanotte"};
  d.months = {{{"gennaio", "gen"}, {"febbraio", "feb"}, {"marzo", "mar"}, {"aprile", "apr"},
               {"maggio", "mag"}, {"giugno", "giu"}, {"luglio", "lug"}, {"agosto", "ago"},
               {"settembre", "set"}, {"ottobre", "ott"}, {"novembre", "nov"},
               {"dicembre", "dic"}}};
  d.ordinal_suffixes = {"º", "°"};

  auto& r = p.recurrence;
  r.frequencies = {{{"giornaliero", "giornaliera", "quotidiano", "quotidiana", "ogni giorno",
                     "tutti i giorni", "giornalmente"},
                    {"settimanale", "ogni settimana", "tutte le settimane", "settimanalmente",
                     "alla settimana"},
                    {"mensile", "ogni mese", "tutti i mesi", "mensilmente", "al mese"},
                    {"annuale", "ogni anno", "tutti gli anni", "annualmente", "all'anno"}}};
  r.every = {"ogni", "tutti i", "tutte le"};
  r.other = {"altro", "altra", "altri", "altre"};
  // Weekdays ending in -ì have no distinct plural
  r.plural_weekdays = {{{}, {}, {}, {}, {}, {"sabati"}, {"domeniche"}}};
  r.ordinals = {{{"primo", "prima"}, {"secondo", "seconda"}, {"terzo", "terza"},
                 {"quarto", "quarta"}, {"ultimo", "ultima"}}};
  r.periods = {{{"giorno", "giorni"}, {"settimana", "settimane"}, {"mese", "mesi"},
                {"anno", "anni"}}};

  p.estimate.hours = {"h", "hr", "ore", "ora"};
  p.estimate.minutes = {"m", "min", "minuto", "minuti"};

  p.fallback_statuses = {
    {"open", false, {"da fare", "aperto", "pendente", "todo", "in sospeso"}},
    {"in-progress", false, {"in corso", "in progresso", "facendo", "lavorando"}},
    {"done", true, {"fatto", "completato", "finito", "terminato", "chiuso"}},
    {"cancelled", true, {"cancellato", "annullato", "rimosso"}},
    {"waiting", false, {"in attesa", "aspettando", "bloccato", "fermo"}},
  };
  p.fallback_priorities = {
    {"urgent", false,
     {"urgente", "critico", "critica", "massimo", "massima", "prioritario", "prioritaria"}},
    {"high", false, {"alto", "alta", "importante", "elevato", "elevata"}},
    {"normal", false, {"medio", "media", "normale", "regolare", "standard"}},
    {"low", false, {"basso", "bassa", "minore", "minimo", "minima"}},
  };
  return p;
}

LanguageProfile makeDutch() {
  LanguageProfile p;
  p.code = "nl";
  p.name = "Nederlands";

  p.cues.due = {"vervalt op", "deadline", "moet klaar zijn op", "tegen", "uiterlijk", "voor"};
  p.cues.scheduled = {"gepland voor", "gepland op", "beginnen op", "werken aan", "op"};
  p.cues.range_start = {"van", "vanaf"};
  p.cues.range_end = {"tot", "tot en met", "t/m"};

  p.weekdays = {{{"maandag"}, {"dinsdag"}, {"woensdag"}, {"donderdag"}, {"vrijdag"},
                 {"zaterdag"}, {"zondag"}}};

  auto& d = p.dates;
  d.relative_days = {{"vandaag", 0}, {"vanavond", 0}, {"morgen", 1}, {"gisteren", -1},
                     {"overmorgen", 2}, {"eergisteren", -2}};
  d.now = {"nu"};
  d.next = {"volgende", "komende"};
  d.in = {"over", "binnen"};
  d.at = {"om"};
  d.noon = {"middaguur"};
  d.midnight = {"middernacht"};
  d.months = {{{"januari", "jan"}, {"februari", "feb"}, {"maart", "mrt"}, {"april", "apr"},
               {"mei"}, {"juni", "jun"}, {"juli", "jul"}, {"augustus", "aug"},
               {"september", "sep"}, {"oktober", "okt"}, {"november", "nov"},
               {"december", "dec"}}};
  d.ordinal_suffixes = {"e", "ste", "de"};

  auto& r = p.recurrence;
  r.frequencies = {{{"dagelijks", "elke dag", "iedere dag", "alle dagen"},
                    {"wekelijks", "elke week", "iedere week", "alle weken"},
                    {"maandelijks", "elke maand", "iedere maand", "alle maanden"},
                    {"jaarlijks", "elk jaar", "ieder jaar", "alle jaren"}}};
  r.every = {"elke", "elk", "iedere", "ieder", "alle"};
  r.other = {"andere", "ander"};
  r.plural_weekdays = {{{"maandagen"}, {"dinsdagen"}, {"woensdagen"}, {"donderdagen"},
                        {"vrijdagen"}, {"zaterdagen"}, {"zondagen"}}};
  r.ordinals = {{{"eerste"}, {"tweede"}, {"derde"}, {"vierde"}, {"laatste"}}};
  r.periods = {{{"dag", "dagen"}, {"week", "weken"}, {"maand", "maanden"}, {"jaar", "jaren"}}};

  p.estimate.hours = {"u", "uur", "uren", "h"};
  p.estimate.minutes = {"m", "min", "minuut", "minuten"};

  p.fallback_statuses = {
    {"open", false, {"te doen", "open", "openstaand", "todo"}},
    {"in-progress", false, {"bezig", "in behandeling", "lopend", "in uitvoering"}},
    {"done", true, {"klaar", "gedaan", "voltooid", "afgerond"}},
    {"cancelled", true, {"geannuleerd", "afgebroken", "geschrapt"}},
    {"waiting", false, {"wachtend", "geblokkeerd", "in afwachting", "gepauzeerd"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"urgent", "dringend", "kritiek", "hoogste"}},
    {"high", false, {"hoog", "hoge", "belangrijk"}},
    {"normal", false, {"normaal", "gemiddeld", "standaard"}},
    {"low", false, {"laag", "lage", "gering", "minder belangrijk"}},
  };
  return p;
}

LanguageProfile makePortuguese() {
  LanguageProfile p;
  p.code = "pt";
  p.name = "Português";

  p.cues.due = {"vencimento", "prazo", "deve estar pronto até", "até", "para", "limite"};
  p.cues.scheduled = {"programado para", "agendado para", "começar em", "trabalhar em", "em",
                      "no", "na"};
  p.cues.range_start = {"de", "do", "da", "desde"};
  p.cues.range_end = {"a", "ao", "à", "até"};

  p.weekdays = {{{"segunda-feira", "segunda"}, {"terça-feira", "terça"},
                 {"quarta-feira", "quarta"}, {"quinta-feira", "quinta"},
                 {"sexta-feira", "sexta"}, {"sábado", "sabado"}, {"domingo"}}};

  auto& d = p.dates;
  d.relative_days = {{"hoje", 0}, {"amanhã", 1}, {"ontem", -1}, {"depois de amanhã", 2},
                     {"anteontem", -2}};
  d.now = {"agora"};
  d.next = {"próximo", "próxima"};
  d.next_after = {"que vem"};
  d.in = {"em", "daqui a", "dentro de"};
  d.at = {"às", "as", "à"};
  d.noon = {"meio-dia"};
  d.midnight = {"meia-noite"};
  d.months = {{{"janeiro", "jan"}, {"fevereiro", "fev"}, {"março", "mar"}, {"abril", "abr"},
               {"maio", "mai"}, {"junho", "jun"}, {"julho", "jul"}, {"agosto", "ago"},
               {"setembro", "set"}, {"outubro", "out"}, {"novembro", "nov"},
               {"dezembro", "dez"}}};
  d.ordinal_suffixes = {"º", "°"};
  d.day_month_connectors = {"de"};

  auto& r = p.recurrence;
  r.frequencies = {{{"diário", "diária", "diariamente", "todos os dias", "cada dia", "por dia"},
                    {"semanal", "semanalmente", "toda semana", "todas as semanas",
                     "por semana"},
                    {"mensal", "mensalmente", "todo mês", "todos os meses", "por mês"},
                    {"anual", "anualmente", "todo ano", "todos os anos", "por ano"}}};
  r.every = {"todo", "toda", "todos", "todas", "todos os", "todas as", "cada"};
  r.other = {"outro", "outra", "outros", "outras"};
  r.plural_weekdays = {{{"segundas-feiras", "segundas"}, {"terças-feiras", "terças"},
                        {"quartas-feiras", "quartas"}, {"quintas-feiras", "quintas"},
                        {"sextas-feiras", "sextas"}, {"sábados"}, {"domingos"}}};
  r.ordinals = {{{"primeiro", "primeira"}, {"segundo", "segunda"}, {"terceiro", "terceira"},
                 {"quarto", "quarta"}, {"último", "última"}}};
  r.periods = {{{"dia", "dias"}, {"semana", "semanas"}, {"mês", "meses"}, {"ano", "anos"}}};

  p.estimate.hours = {"h", "hr", "hora", "horas"};
  p.estimate.minutes = {"m", "min", "minuto", "minutos"};

  p.fallback_statuses = {
    {"open", false, {"a fazer", "pendente", "aberto", "todo", "por fazer"}},
    {"in-progress", false,
     {"em andamento", "em progresso", "fazendo", "trabalhando", "executando"}},
    {"done", true, {"feito", "concluído", "terminado", "finalizado", "completo"}},
    {"cancelled", true, {"cancelado", "anulado", "suspenso"}},
    {"waiting", false, {"aguardando", "esperando", "bloqueado", "em espera"}},
  };
  p.fallback_priorities = {
    {"urgent", false,
     {"urgente", "crítico", "crítica", "máximo", "máxima", "prioritário", "prioritária"}},
    {"high", false, {"alto", "alta", "importante", "elevado", "elevada"}},
    {"normal", false, {"médio", "média", "normal", "regular", "padrão"}},
    {"low", false, {"baixo", "baixa", "menor", "mínimo", "mínima"}},
  };
  return p;
}

LanguageProfile makeSwedish() {
  LanguageProfile p;
  p.code = "sv";
  p.name = "Svenska";

  p.cues.due = {"förfaller", "deadline", "måste vara klar", "senast", "till", "innan"};
  p.cues.scheduled = {"schemalagd", "planerad för", "börja", "arbeta med", "den", "på"};
  p.cues.range_start = {"från", "från och med"};
  p.cues.range_end = {"till", "fram till", "till och med"};

  p.weekdays = {{{"måndag"}, {"tisdag"}, {"onsdag"}, {"torsdag"}, {"fredag"}, {"lördag"},
                 {"söndag"}}};

  auto& d = p.dates;
  d.relative_days = {{"idag", 0}, {"i dag", 0}, {"ikväll", 0}, {"imorgon", 1}, {"i morgon", 1},
                     {"igår", -1}, {"i går", -1}, {"i övermorgon", 2}, {"i förrgår", -2}};
  d.now = {"nu"};
  d.next = {"nästa", "kommande"};
  d.in = {"om"};
  d.at = {"kl", "kl.", "klockan"};
  d.noon = {"mitt på dagen"};
  d.midnight = {"midnatt"};
  d.months = {{{"januari", "jan"}, {"februari", "feb"}, {"mars", "mar"}, {"april", "apr"},
               {"maj"}, {"juni", "jun"}, {"juli", "jul"}, {"augusti", "aug"},
               {"september", "sep"}, {"oktober", "okt"}, {"november", "nov"},
               {"december", "dec"}}};
  d.ordinal_suffixes = {":e", ":a"};

  auto& r = p.recurrence;
  r.frequencies = {{{"dagligen", "varje dag", "alla dagar", "per dag"},
                    {"veckovis", "varje vecka", "alla veckor", "per vecka"},
                    {"månadsvis", "varje månad", "alla månader", "per månad"},
                    {"årligen", "varje år", "alla år", "per år"}}};
  r.every = {"varje", "alla", "var"};
  r.other = {"annan", "annat", "andra"};
  r.plural_weekdays = {{{"måndagar"}, {"tisdagar"}, {"onsdagar"}, {"torsdagar"}, {"fredagar"},
                        {"lördagar"}, {"söndagar"}}};
  r.ordinals = {{{"första"}, {"andra"}, {"tredje"}, {"fjärde"}, {"sista"}}};
  r.periods = {{{"dag", "dagar"}, {"vecka", "veckor"}, {"månad", "månader"}, {"år"}}};

  p.estimate.hours = {"t", "tim", "timme", "timmar", "h"};
  p.estimate.minutes = {"m", "min", "minut", "minuter"};

  p.fallback_statuses = {
    {"open", false, {"att göra", "öppen", "kvar", "todo", "väntande"}},
    {"in-progress", false, {"pågående", "arbetar", "gör", "i process", "under arbete"}},
    {"done", true, {"klar", "färdig", "slutförd", "avslutad", "gjord"}},
    {"cancelled", true, {"avbruten", "inställd", "avbokad"}},
    {"waiting", false, {"väntar", "blockerad", "pausad", "vilande"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"brådskande", "kritisk", "högsta", "akut", "omedelbar"}},
    {"high", false, {"hög", "viktig", "förhöjd", "prioriterad"}},
    {"normal", false, {"normal", "medel", "standard", "vanlig"}},
    {"low", false, {"låg", "mindre", "minimal", "obetydlig"}},
  };
  return p;
}

// Japanese and Chinese words match between spaces or punctuation. Text
// without spaces between words is not segmented.
LanguageProfile makeJapanese() {
  LanguageProfile p;
  p.code = "ja";
  p.name = "日本語";

  p.cues.due = {"期限", "締切", "〆切", "まで", "までに", "に"};
  p.cues.scheduled = {"予定", "計画", "開始", "から", "に開始", "を開始"};

  // Single-kanji forms ("月", "日") are left out, they collide with periods
  p.weekdays = {{{"月曜日", "月曜", "げつようび"}, {"火曜日", "火曜", "かようび"},
                 {"水曜日", "水曜", "すいようび"}, {"木曜日", "木曜", "もくようび"},
                 {"金曜日", "金曜", "きんようび"}, {"土曜日", "土曜", "どようび"},
                 {"日曜日", "日曜", "にちようび"}}};

  auto& d = p.dates;
  d.relative_days = {{"今日", 0}, {"きょう", 0}, {"今夜", 0}, {"明日", 1}, {"あした", 1},
                     {"昨日", -1}, {"明後日", 2}, {"あさって", 2}, {"一昨日", -2}};
  d.now = {"今", "いま"};
  d.next = {"次の", "来週の"};
  d.noon = {"正午"};
  d.midnight = {"真夜中"};
  d.am = {"午前"};
  d.pm = {"午後"};
  d.hour_suffix = {"時"};
  d.months = {{{"1月", "一月"}, {"2月", "二月"}, {"3月", "三月"}, {"4月", "四月"},
               {"5月", "五月"}, {"6月", "六月"}, {"7月", "七月"}, {"8月", "八月"},
               {"9月", "九月"}, {"10月", "十月"}, {"11月", "十一月"}, {"12月", "十二月"}}};

  auto& r = p.recurrence;
  r.frequencies = {{{"毎日", "日々", "毎日毎日", "連日"},
                    {"毎週", "週毎", "週一", "毎週毎週"},
                    {"毎月", "月毎", "月一", "毎月毎月"},
                    {"毎年", "年毎", "年一", "毎年毎年", "年次"}}};
  r.every = {"毎", "各", "全て"};
  r.other = {"他の", "別の", "異なる"};
  r.plural_weekdays = p.weekdays;
  r.ordinals = {{{"最初の", "第一の", "一番目の", "初回"}, {"二番目の", "第二の", "次の"},
                 {"三番目の", "第三の"}, {"四番目の", "第四の"},
                 {"最後の", "最終の", "終わりの"}}};
  r.periods = {{{"日", "日間"}, {"週", "週間"}, {"月", "月間", "ヶ月"}, {"年", "年間"}}};

  p.estimate.hours = {"時間", "時", "じかん"};
  p.estimate.minutes = {"分", "分間", "ふん", "ぷん"};

  p.fallback_statuses = {
    {"open", false, {"未着手", "新規", "オープン", "開始前"}},
    {"in-progress", false, {"進行中", "作業中", "実行中", "処理中", "進行"}},
    {"done", true, {"完了", "終了", "済み", "終わり", "達成"}},
    {"cancelled", true, {"キャンセル", "中止", "取消", "廃止", "停止"}},
    {"waiting", false, {"待機", "保留", "ブロック", "一時停止", "待ち"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"緊急", "至急", "急務", "最優先", "すぐに"}},
    {"high", false, {"高", "重要", "優先", "高優先度", "重点"}},
    {"normal", false, {"普通", "通常", "標準", "一般", "ノーマル"}},
    {"low", false, {"低", "軽微", "後回し", "低優先度", "余裕"}},
  };
  return p;
}

LanguageProfile makeChinese() {
  LanguageProfile p;
  p.code = "zh";
  p.name = "中文";

  p.cues.due = {"截止", "到期", "期限", "之前"};
  p.cues.scheduled = {"安排在", "计划在", "开始在", "在"};
  p.cues.range_start = {"从", "自"};
  p.cues.range_end = {"到", "至"};

  p.weekdays = {{{"周一", "星期一", "礼拜一"}, {"周二", "星期二", "礼拜二"},
                 {"周三", "星期三", "礼拜三"}, {"周四", "星期四", "礼拜四"},
                 {"周五", "星期五", "礼拜五"}, {"周六", "星期六", "礼拜六"},
                 {"周日", "星期日", "星期天", "礼拜日", "礼拜天"}}};

  auto& d = p.dates;
  d.relative_days = {{"今天", 0}, {"今晚", 0}, {"明天", 1}, {"昨天", -1}, {"后天", 2},
                     {"前天", -2}};
  d.now = {"现在"};
  d.next = {"下个", "下"};
  d.noon = {"中午"};
  d.midnight = {"午夜"};
  d.am = {"上午"};
  d.pm = {"下午"};
  d.hour_suffix = {"点"};
  d.months = {{{"一月", "1月"}, {"二月", "2月"}, {"三月", "3月"}, {"四月", "4月"},
               {"五月", "5月"}, {"六月", "6月"}, {"七月", "7月"}, {"八月", "8月"},
               {"九月", "9月"}, {"十月", "10月"}, {"十一月", "11月"}, {"十二月", "12月"}}};

  auto& r = p.recurrence;
  r.frequencies = {{{"每天", "每日", "天天", "日常"},
                    {"每周", "每星期", "周周"},
                    {"每月", "每个月", "月月"},
                    {"每年", "年年", "每一年"}}};
  r.every = {"每", "每个", "每一个"};
  r.other = {"其他", "另一个"};
  r.plural_weekdays = p.weekdays;
  r.ordinals = {{{"第一个", "第一", "首个"}, {"第二个", "第二"}, {"第三个", "第三"},
                 {"第四个", "第四"}, {"最后一个", "最后", "末尾"}}};
  r.periods = {{{"天", "日"}, {"周", "星期", "礼拜"}, {"月", "个月"}, {"年"}}};

  p.estimate.hours = {"小时", "时", "个小时"};
  p.estimate.minutes = {"分钟", "分", "个分钟"};

  p.fallback_statuses = {
    {"open", false, {"待办", "未完成", "开放", "新建"}},
    {"in-progress", false, {"进行中", "正在处理", "处理中", "工作中"}},
    {"done", true, {"完成", "已完成", "结束", "搞定"}},
    {"cancelled", true, {"取消", "已取消", "废弃"}},
    {"waiting", false, {"等待", "暂停", "阻塞", "待定"}},
  };
  p.fallback_priorities = {
    {"urgent", false, {"紧急", "急迫", "立即", "马上"}},
    {"high", false, {"高", "重要", "优先", "高优先级"}},
    {"normal", false, {"正常", "普通", "中等", "标准"}},
    {"low", false, {"低", "不重要", "低优先级", "次要"}},
  };
  return p;
}

const std::map<std::string, LanguageProfile, std::less<>>& registry() {
  static const std::map<std::string, LanguageProfile, std::less<>> profiles = [] {
    std::map<std::string, LanguageProfile, std::less<>> result;
    for (auto&& profile : {makeEnglish(), makeGerman(), makeSpanish(), makeFrench(),
                           makeItalian(), makeDutch(), makePortuguese(), makeSwedish(),
                           makeJapanese(), makeChinese()}) {
      result.emplace(profile.code, profile);
    }
    return result;
  }();
  return profiles;
}

std::string normalizeCode(std::string_view code) {
  std::string result;
  for (char c : code) {
    if (c == '-' || c == '_') {
      break;
    }
    result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return result;
}

}  // namespace

const LanguageProfile& languageProfile(std::string_view code) {
  const auto& profiles = registry();
  auto it = profiles.find(normalizeCode(code));
  if (it == profiles.end()) {
    return profiles.at("en");
  }
  return it->second;
}

bool isSupportedLanguage(std::string_view code) {
  return registry().contains(normalizeCode(code));
}

std::vector<std::string> availableLanguages() {
  std::vector<std::string> codes;
  for (const auto& [code, profile] : registry()) {
    codes.push_back(code);
  }
  return codes;
}

core::Lexicon fallbackLexicon(const std::vector<FallbackKeywords>& keywords) {
  core::Lexicon lexicon;
  for (size_t group = 0; group < keywords.size(); ++group) {
    const auto& entry = keywords[group];
    for (const auto& word : entry.words) {
      lexicon.push_back({entry.canonical_id, word, word, entry.is_terminal,
                         static_cast<int>(group)});
    }
  }
  return lexicon;
}

}  // namespace tasklex::nlp
